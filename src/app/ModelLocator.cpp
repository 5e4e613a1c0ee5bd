#include "ModelLocator.h"

#include <cstdlib>
#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <system_error>

#include "logging.h"

namespace fs = std::filesystem;

namespace {

constexpr std::string_view model_prefix = "ggml-";
constexpr std::string_view model_extension = ".bin";

constexpr auto known_quantizations = std::to_array<std::string_view>({
    "q4_0", "q4_1", "q5_0", "q5_1", "q8_0", "f16", "f32"
});

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anon ns

ModelLocator::ModelLocator(ModelSearchConfig config)
    : config_(std::move(config))
{}

DiscoveredModel ModelLocator::parse_file_name(const fs::path &path)
{
    DiscoveredModel dm;
    dm.path = path;

    if (to_lower(path.extension().string()) != model_extension) {
        return dm;
    }

    const auto stem = path.stem().string();
    if (!stem.starts_with(model_prefix) || stem.size() == model_prefix.size()) {
        return dm;
    }

    auto rest = stem.substr(model_prefix.size());
    if (const auto dash = rest.rfind('-'); dash != std::string::npos && dash > 0) {
        const auto suffix = to_lower(rest.substr(dash + 1));
        if (std::find(known_quantizations.begin(), known_quantizations.end(), suffix) != known_quantizations.end()) {
            dm.quantization_hint = suffix;
            rest.resize(dash);
        }
    }

    dm.name = std::move(rest);
    return dm;
}

int ModelLocator::quantization_score(std::string_view quant_hint) const {
    const auto& preference = config_.quantization_preference;
    const auto num = static_cast<int>(preference.size());

    if (quant_hint.empty()) {
        return 0; // below every preferred quantization
    }

    for (int i = 0; i < num; ++i) {
        if (preference[static_cast<size_t>(i)] == quant_hint) {
            // higher score = better
            return num - i;
        }
    }

    return -1;
}

// Default search roots for whisper.cpp models
std::vector<fs::path> ModelLocator::build_default_search_paths() const {
    std::vector<fs::path> paths;

    if (const char* v = std::getenv("WHISPER_MODELS_PATH"); v && *v) {
        paths.emplace_back(v);
    }

    fs::path home;
    if (const char* v = std::getenv("HOME"); v && *v) {
        home = v;
    }

#ifdef __APPLE__
    if (!home.empty()) {
        paths.push_back(home / "Library/Caches/whisper");
    }
#elif defined(_WIN32)
    if (const char* v = std::getenv("LOCALAPPDATA"); v && *v) {
        paths.push_back(fs::path{v} / "whisper");
    }
#else
    if (!home.empty()) {
        paths.push_back(home / ".cache/whisper");
    }
#endif

    return paths;
}

std::vector<fs::path> ModelLocator::effective_search_paths() const {
    std::vector<fs::path> result = config_.extra_search_paths;
    if (config_.include_default_paths) {
        auto defaults = build_default_search_paths();
        result.insert(result.end(), defaults.begin(), defaults.end());
    }

    result.erase(std::remove_if(result.begin(), result.end(),
                                [](const fs::path& p) { return p.empty(); }),
                 result.end());
    return result;
}

std::vector<DiscoveredModel> ModelLocator::scan_paths(
        const std::vector<fs::path>& roots) const
{
    std::vector<DiscoveredModel> result;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }

        LOG_TRACE_N << "Scanning " << root << " for models";
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::error_code fec;
            if (!entry.is_regular_file(fec)) {
                continue;
            }

            auto dm = parse_file_name(entry.path());
            if (dm.name.empty()) {
                continue;
            }

            dm.size_bytes = entry.file_size(fec);
            if (fec) {
                dm.size_bytes = 0;
            }
            result.push_back(std::move(dm));
        }

        if (ec) {
            LOG_WARN_N << "Failed to scan " << root << ": " << ec.message();
        }
    }

    return result;
}

std::vector<DiscoveredModel> ModelLocator::list_all_models() const {
    return scan_paths(effective_search_paths());
}

std::vector<std::string> ModelLocator::available_models() const {
    std::set<std::string> names;
    for (const auto& dm : list_all_models()) {
        names.insert(dm.name);
    }
    return {names.begin(), names.end()};
}

std::optional<DiscoveredModel> ModelLocator::find_model(std::string_view name) const {
    if (name.empty()) {
        return {};
    }

    std::optional<DiscoveredModel> best;
    int best_score = 0;

    // Earlier roots win ties, so extra paths shadow the defaults
    for (auto& cand : list_all_models()) {
        if (cand.name != name) {
            continue;
        }

        const auto score = quantization_score(cand.quantization_hint);
        if (!best || score > best_score) {
            best_score = score;
            best = std::move(cand);
        }
    }

    if (best) {
        LOG_DEBUG_N << "Model " << name << " resolved to " << best->path;
    } else {
        LOG_DEBUG_N << "Model " << name << " not found";
    }

    return best;
}


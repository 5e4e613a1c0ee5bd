#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

/// Hints when searching / scoring models.
struct ModelSearchConfig {
    /// If true, search the default whisper.cpp cache locations
    bool include_default_paths = true;

    /// Additional search roots (recursively scanned), searched first.
    std::vector<std::filesystem::path> extra_search_paths;

    /// Quantization preference, highest priority first.
    /// Unquantized files rank after these, and unknown quantizations last.
    std::vector<std::string> quantization_preference = {
        "q5_1", "q5_0", "q8_0", "f16"
    };
};

/// A whisper.cpp model file on disk, named ggml-<name>[-<quantization>].bin
struct DiscoveredModel {
    std::string name;                    ///< "base", "small.en", "large-v3"
    std::filesystem::path   path;                     ///< full filesystem path
    std::string quantization_hint;       ///< "q5_1", "f16", or empty
    std::uintmax_t size_bytes = 0;       ///< 0 if unknown
};

class ModelLocator {
public:
    explicit ModelLocator(ModelSearchConfig config = {});

    /// Re-scan all search paths and return every model we recognize.
    std::vector<DiscoveredModel> list_all_models() const;

    /// Sorted, unique model names found on disk.
    std::vector<std::string> available_models() const;

    /// Find the best file for an exact model name ("base.en" does not match "base").
    std::optional<DiscoveredModel> find_model(std::string_view name) const;

    bool model_exists(std::string_view name) const {
        return find_model(name).has_value();
    }

    /// Expose effective search paths (extra + defaults).
    std::vector<std::filesystem::path> effective_search_paths() const;

    /// Splits a file name like "ggml-small.en-q5_1.bin". Empty name if it is not a whisper model.
    static DiscoveredModel parse_file_name(const std::filesystem::path& path);

private:
    ModelSearchConfig config_;

    std::vector<std::filesystem::path> build_default_search_paths() const;
    std::vector<DiscoveredModel> scan_paths(const std::vector<std::filesystem::path>& roots) const;
    int quantization_score(std::string_view quant_hint) const;
};


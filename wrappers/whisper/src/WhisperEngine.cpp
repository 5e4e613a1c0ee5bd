
#include <algorithm>
#include <atomic>
#include <cassert>
#include <format>
#include <memory>
#include <mutex>
#include <thread>

#include "qdt/WhisperEngine.h"
#include "qdt/log_wrapper.h"

#include <whisper.h>

using namespace std;

namespace qdt {

namespace {

class WhisperImpl;
class WhisperCtxImpl;

void whisperLogger(ggml_log_level level, const char *msg, void *) {
    string_view message(msg ? msg : "");
    if (!message.empty() && message.back() == '\n') {
        message.remove_suffix(1);
    }

    switch(level) {
    case GGML_LOG_LEVEL_ERROR:
        LOG_ERROR << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_WARN:
        LOG_WARN << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_INFO:
        LOG_DEBUG << "[whisper] " << message;
        break;
    case GGML_LOG_LEVEL_DEBUG:
    case GGML_LOG_LEVEL_CONT:
        LOG_TRACE << "[whisper] " << message;
        break;
    default:
        break;
    }
}

int defaultThreads() {
    const auto thds = std::thread::hardware_concurrency();
    if (thds > 32) {
        return static_cast<int>(thds - 4);
    }
    if (thds > 4) {
        return static_cast<int>(thds - 1);
    }
    return 4;
}

class WhisperSessionCtxImpl final : public SessionCtx {
public:
    WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state);
    ~WhisperSessionCtxImpl() override;

    void setOnPartialTextCallback(partial_text_cb_t callback) override {
        on_partial_text_ = std::move(callback);
    }

    void setAbortCallback(abort_cb_t callback) override {
        should_abort_ = std::move(callback);
    }

    bool transcribe(std::span<const float> data, const TranscribeParams &params, Transcript& out) override;

    string lastError() const noexcept override {
        return error_;
    }

private:
    static void onNewSegment(whisper_context *, whisper_state *state, int nNew, void *userData);
    static bool onAbort(void *userData);

    shared_ptr<WhisperCtxImpl> model_ctx_;
    whisper_state *state_{nullptr};
    partial_text_cb_t on_partial_text_;
    abort_cb_t should_abort_;
    string error_;
};

class WhisperCtxImpl final : public ModelCtx, public enable_shared_from_this<WhisperCtxImpl> {
public:
    WhisperCtxImpl(shared_ptr<atomic_int> loadedCounter, string version, string_view modelId, whisper_context *ctx)
        : loaded_counter_{std::move(loadedCounter)}, version_{std::move(version)}, model_id_{modelId}, ctx_{ctx}
    {
        assert(ctx_ != nullptr);
        ++*loaded_counter_;
    }

    ~WhisperCtxImpl() override {
        if (ctx_) {
            LOG_TRACE << "Freeing Whisper model context for " << model_id_;
            whisper_free(ctx_);
            ctx_ = nullptr;
            --*loaded_counter_;
        }
    }

    string info() const noexcept override {
        return format("{}, model={}", version_, model_id_);
    }

    const string &modelId() const noexcept override {
        return model_id_;
    }

    shared_ptr<SessionCtx> createSession() override {
        assert(ctx_ != nullptr);

        LOG_DEBUG << "Creating new Whisper session for model " << model_id_;

        if (auto *state = whisper_init_state(ctx_)) {
            return make_shared<WhisperSessionCtxImpl>(shared_from_this(), state);
        }

        LOG_ERROR << "whisper_init_state failed for model " << model_id_;
        return {};
    }

    whisper_context *ctx() noexcept {
        return ctx_;
    }

private:
    shared_ptr<atomic_int> loaded_counter_;
    const string version_;
    const string model_id_;
    whisper_context *ctx_{nullptr};
};

class WhisperImpl final : public WhisperEngine {
public:
    explicit WhisperImpl(const WhisperCreateParams&)
    {
        LOG_DEBUG << "Creating Whisper engine";
        whisper_log_set(whisperLogger, nullptr);
    }

    ~WhisperImpl() override {
        LOG_DEBUG << "Destroying Whisper engine with " << numLoadedModels() << " loaded models";
    }

    int numLoadedModels() const noexcept override {
        return num_loaded_models_->load();
    }

    string version() const override {
        string_view v;
        if (const auto *p = whisper_version()) {
            v = p;
        }

        return format("whisper.cpp version {}", v);
    }

    void setLogger(logfwd::callback_t cb, logfwd::Level level) override {
        logfwd::setCallback(std::move(cb), "WhisperEngine");
        logfwd::setLevel(level);
    }

    bool init() override {
        LOG_INFO << "Whisper engine initialized: " << whisper_print_system_info();
        return clearError();
    }

    string lastError() const noexcept override {
        std::lock_guard lock{mutex_};
        return error_;
    }

    shared_ptr<ModelCtx> load(const string &modelId, const filesystem::path &modelPath, const EngineLoadParams &params) override {
        WhisperEngineLoadParams wp;
        if (const auto *wparams = dynamic_cast<const WhisperEngineLoadParams*>(&params)) {
            wp = *wparams;
        }

        auto cparams = whisper_context_default_params();
        cparams.use_gpu = wp.use_gpu;
        cparams.flash_attn = wp.use_gpu && wp.flash_attn;
        cparams.gpu_device = wp.gpu_device;

        // DTW features are advanced; keep disabled
        cparams.dtw_token_timestamps = false;
        cparams.dtw_aheads_preset = WHISPER_AHEADS_NONE;

        LOG_DEBUG << "Loading Whisper model " << modelId << " from " << modelPath
                  << " use_gpu=" << cparams.use_gpu;

        if (auto *ctx = whisper_init_from_file_with_params_no_state(modelPath.c_str(), cparams)) {
            clearError();
            // When the shared pointer goes out of scope, the model context is unloaded
            return make_shared<WhisperCtxImpl>(num_loaded_models_, version(), modelId, ctx);
        }

        LOG_ERROR << "Failed to load Whisper model from " << modelPath;
        setError(format("Failed to load Whisper model from {}", modelPath.string()));
        return {};
    }

private:
    // Returns true if msg is empty
    bool setError(string msg) {
        std::lock_guard lock{mutex_};
        error_ = std::move(msg);
        return error_.empty();
    }

    bool clearError() {
        return setError({});
    }

    mutable std::mutex mutex_;
    string error_;
    shared_ptr<atomic_int> num_loaded_models_{make_shared<atomic_int>(0)};
};

WhisperSessionCtxImpl::WhisperSessionCtxImpl(shared_ptr<WhisperCtxImpl> modelCtx, whisper_state *state)
    : model_ctx_{std::move(modelCtx)}, state_{state}
{
    assert(model_ctx_ != nullptr);
    assert(state_ != nullptr);
}

WhisperSessionCtxImpl::~WhisperSessionCtxImpl()
{
    if (state_) {
        LOG_TRACE << "Freeing Whisper state";
        whisper_free_state(state_);
    }
}

void WhisperSessionCtxImpl::onNewSegment(whisper_context *, whisper_state *state, int nNew, void *userData)
{
    auto *self = static_cast<WhisperSessionCtxImpl *>(userData);
    if (!self->on_partial_text_) {
        return;
    }

    const int n = whisper_full_n_segments_from_state(state);
    string text;
    for (int i = std::max(0, n - nNew); i < n; ++i) {
        if (const char *txt = whisper_full_get_segment_text_from_state(state, i)) {
            text += txt;
        }
    }

    if (!text.empty()) {
        self->on_partial_text_(text);
    }
}

bool WhisperSessionCtxImpl::onAbort(void *userData)
{
    const auto *self = static_cast<const WhisperSessionCtxImpl *>(userData);
    return self->should_abort_ && self->should_abort_();
}

bool WhisperSessionCtxImpl::transcribe(std::span<const float> data, const TranscribeParams &params, Transcript& out) {
    error_.clear();

    if (params.sample_rate != WHISPER_SAMPLE_RATE) {
        error_ = format("Whisper needs {} Hz audio, got {} Hz", WHISPER_SAMPLE_RATE, params.sample_rate);
        return false;
    }

    auto p = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    p.n_threads = params.threads > 0 ? params.threads : defaultThreads();
    p.print_progress = false;
    p.print_realtime = false;
    p.print_timestamps = false;
    p.print_special = false;

    if (!params.language.empty()) {
        p.language = params.language.c_str();
        p.detect_language = false;
    } else {
        p.language = "auto";
    }
    if (params.no_context.has_value()) {
        p.no_context = params.no_context.value();
    }
    if (params.single_segment.has_value()) {
        p.single_segment = params.single_segment.value();
    }
    if (params.suppress_blank.has_value()) {
        p.suppress_blank = params.suppress_blank.value();
    }

    p.new_segment_callback = &WhisperSessionCtxImpl::onNewSegment;
    p.new_segment_callback_user_data = this;
    p.abort_callback = &WhisperSessionCtxImpl::onAbort;
    p.abort_callback_user_data = this;

    LOG_TRACE << "Whisper full params: "
              << "language='" << p.language << "', "
              << "n_threads=" << p.n_threads << ", "
              << "no_context=" << p.no_context << ", "
              << "single_segment=" << p.single_segment << ", "
              << "samples=" << data.size();

    const auto rc = whisper_full_with_state(model_ctx_->ctx(), state_, p, data.data(), static_cast<int>(data.size()));
    if (rc != 0) {
        error_ = onAbort(this) ? "aborted" : format("whisper_full failed with code {}", rc);
        return false;
    }

    out.segments.clear();
    out.full_text.clear();

    const int n = whisper_full_n_segments_from_state(state_);
    out.segments.reserve(static_cast<size_t>(std::max(0, n)));

    for (int i = 0; i < n; ++i) {
        Segment seg{};
        seg.t0_ms = whisper_full_get_segment_t0_from_state(state_, i) * 10; // whisper uses 10ms units
        seg.t1_ms = whisper_full_get_segment_t1_from_state(state_, i) * 10;

        if (const char* txt = whisper_full_get_segment_text_from_state(state_, i)) {
            seg.text.assign(txt);
            out.full_text += seg.text;
        }

        seg.no_speech_prob = whisper_full_get_segment_no_speech_prob_from_state(state_, i);
        out.segments.push_back(std::move(seg));
    }

    if (!params.language.empty()) {
        out.language = params.language;
    } else if (const auto id = whisper_full_lang_id_from_state(state_); id >= 0) {
        if (const char *lang = whisper_lang_str(id)) {
            out.language = lang;
        }
    }

    return true;
}

} // anon ns

std::shared_ptr<WhisperEngine> WhisperEngine::create(const WhisperCreateParams &params)
{
    LOG_DEBUG << "Creating Whisper engine instance";
    return make_shared<WhisperImpl>(params);
}

WhisperEngine::WhisperEngine() = default;

WhisperEngine::~WhisperEngine() = default;

} // ns

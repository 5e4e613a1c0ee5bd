#pragma once

#include <string>
#include <memory>
#include <string_view>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>
#include <cstdint>

/*! Only pure interfaces here. The implementations will be in separate libraries.
 */

namespace qdt {

class EngineBase;

/*! Parameters for loading the model.
 *
 * Specific engines may extend this struct with their own parameters.
 */
struct EngineLoadParams {
    EngineLoadParams() = default;
    virtual ~EngineLoadParams() = default;
};

struct TranscribeParams {
    std::string language; // empty for auto
    int threads{-1}; // -1 for using default
    int sample_rate{16000};
    std::optional<bool> no_context;
    std::optional<bool> single_segment;
    std::optional<bool> suppress_blank;
};

struct Segment {
    int64_t t0_ms = 0;
    int64_t t1_ms = 0;
    std::string text;
    float no_speech_prob = 0.0f;
};

struct Transcript {
    std::vector<Segment> segments;
    std::string full_text;
    std::string language;               // detected or forced
};

/*! Context for one transcription task.
 *
 * A session owns the engine's per-task scratch state. It is cheap compared to
 * the model, and is released when the task is done.
 */
class SessionCtx {
public:
    using partial_text_cb_t = std::function<void(const std::string&)>;
    using abort_cb_t = std::function<bool()>;

    SessionCtx() = default;
    virtual ~SessionCtx() = default;

    /*! Sets a callback function to receive partial text results during processing.
     *
     * @param callback Function to be called with the text of each new segment.
     */
    virtual void setOnPartialTextCallback(partial_text_cb_t callback) = 0;

    /*! Sets a callback polled by the engine between units of work.
     *
     * When it returns true, the engine stops as soon as it can and
     * transcribe() returns false.
     */
    virtual void setAbortCallback(abort_cb_t callback) = 0;

    /*! Runs inference over the complete signal.
     *
     * @param data Mono float samples in [-1, 1] at params.sample_rate.
     * @param params Parameters for the processing.
     * @param out Output transcript structure to hold the results.
     * @return True if processing was successful, false otherwise.
     */
    virtual bool transcribe(std::span<const float> data,
                            const TranscribeParams& params,
                            Transcript& out) = 0;

    virtual std::string lastError() const noexcept = 0;
};

/*! Context for a loaded model.
 *
 * Specific engines will define their own context structures.
 */
class ModelCtx {
public:
    ModelCtx() = default;
    virtual ~ModelCtx() = default;

    virtual std::string info() const noexcept = 0;

    virtual const std::string& modelId() const noexcept = 0;

    /*! Creates a new session context for processing.
     *
     * @return Shared pointer to the newly created session context, or nullptr on failure.
     */
    virtual std::shared_ptr<SessionCtx> createSession() = 0;
};


/* Abstract interface for the engine base.
 *
 * The actual implementation (whisper) derives from this. It is built as a
 * separate shared library to keep the dependency isolated.
 */

class EngineBase {
public:
    EngineBase() = default;
    virtual ~EngineBase() = default;

    /*! Returns the version string of the underlying engine/library.
     *
     * Example: "whisper.cpp 1.7.4"
     */
    virtual std::string version() const = 0;

    /*! One time initialization of the engine.
     *
     * Must be called before any other methods.
     */
    virtual bool init() = 0;

    /*! Reurns the last error message, if any.
     *
     * If the last operation was successful, returns an empty string.
     */
    virtual std::string lastError() const noexcept = 0;

    /*! Loads the model from the given path with the specified parameters.
     *
     * When the shared pointer goes out of scope, the model context is unloaded.
     * The engine is not required to be reentrant. Callers must not use one
     * model from two threads at the same time.
     *
     * @param modelId Identifier of the model being loaded.
     * @param modelPath Filesystem path to the model file.
     * @param params Load parameters specific to the engine.
     *
     * @return Shared pointer to the loaded model context, or nullptr on failure.
     */
    virtual std::shared_ptr<ModelCtx> load(const std::string& modelId,
                                           const std::filesystem::path& modelPath,
                                           const EngineLoadParams& params) = 0;

    virtual int numLoadedModels() const noexcept = 0;
};

} // ns

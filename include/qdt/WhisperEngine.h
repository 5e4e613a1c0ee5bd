#pragma once

#include "EngineBase.h"
#include "log_wrapper.h"

#if defined(_WIN32)
#if defined(QDT_WHISPER_WRAP_BUILD)
#define QDT_WHISPER_WRAP_API __declspec(dllexport)
#else
#define QDT_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define QDT_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace qdt {

struct WhisperEngineLoadParams : public EngineLoadParams {
    bool use_gpu{};
    bool flash_attn{};
    int gpu_device{};
};

/*! Whisper engine interface
 *
 */
class QDT_WHISPER_WRAP_API WhisperEngine : public EngineBase {
public:
    QDT_WHISPER_WRAP_API WhisperEngine();
    QDT_WHISPER_WRAP_API virtual ~WhisperEngine();

    struct WhisperCreateParams{};

    /*! Creates a new Whisper engine instance.
     *
     * @param params Parameters for creating the engine.
     * @return Shared pointer to the new Whisper engine instance.
     */
    static QDT_WHISPER_WRAP_API std::shared_ptr<WhisperEngine> create(const WhisperCreateParams& params);

    // Routes the library's log output to the application's logger
    virtual void setLogger(logfwd::callback_t cb, logfwd::Level level) = 0;
};

} // ns

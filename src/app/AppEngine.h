#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <optional>

#include <QObject>

#include <qcorotask.h>

#include "qdt/EngineBase.h"

#include "AppConfig.h"
#include "AudioInput.h"
#include "AudioTypes.h"
#include "Errors.h"

class AudioRecorder;
class TranscriptionWorker;

/*! Coordinates recording and transcription.
 *
 *  The single owner of the application state. Every change goes through a
 *  command, and commands that arrive while another is being handled (for
 *  example from a stateChanged() handler) are queued, with duplicates
 *  collapsed, and run when the current one is done.
 *
 *  Lives on the Qt event loop thread.
 */
class AppEngine : public QObject
{
    Q_OBJECT

    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    enum class State {
        Idle,
        Recording,
        Processing
    };
    Q_ENUM(State)

    enum class Command {
        Start,
        Stop,
        Cancel,
        ApplyConfig,
        Complete,
        Abort
    };

    AppEngine(AppConfig config,
              AudioInput& input,
              std::shared_ptr<qdt::EngineBase> engine,
              std::shared_ptr<const qdt::EngineLoadParams> loadParams = {},
              QObject *parent = nullptr);
    ~AppEngine() override;

    Q_INVOKABLE void startRecording();
    Q_INVOKABLE void stopRecording();
    Q_INVOKABLE void toggleRecording();
    Q_INVOKABLE void cancelTranscription();
    void applyConfig(AppConfig config);

    // Loads the configured model in the background, if it is on disk
    void preloadModel();

    // Stops everything. Waits up to timeout for the transcription worker.
    bool shutdown(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    State state() const noexcept { return state_; }
    const AppConfig& config() const noexcept { return config_; }
    TranscriptionWorker& worker() noexcept { return *worker_; }
    AudioRecorder& recorder() noexcept { return *recorder_; }

    static void initLogging();

signals:
    void stateChanged(AppEngine::State newState);
    void volumeChanged(float level);
    void transcriptionProgress(const QString& text);
    void transcriptionCompleted(const QString& text);
    void transcriptionFailed(const QString& reason);
    void captureFailed(const QString& reason);
    void configChanged();

private:
    struct ModelPaths;

    struct Outcome {
        quint64 id{};
        std::optional<QString> text;
        std::optional<TranscriptionFailure> failure;
    };

    void request(Command cmd);
    void dispatch(Command cmd);
    void doStart();
    void doStop();
    void doCancel();
    void doApplyConfig();
    void doComplete();
    void doAbort();
    QCoro::Task<void> processRecording(std::unique_ptr<CaptureSession> session);
    void onWorkerResult(quint64 id, const QString& text);
    void onWorkerFailed(quint64 id, const TranscriptionFailure& failure);
    void onCaptureFailed(const CaptureError& error);
    void failed(const QString& why);
    void setState(State newState);

    AppConfig config_;
    std::optional<AppConfig> pending_config_;
    AudioInput& input_;
    std::shared_ptr<ModelPaths> model_paths_;
    std::unique_ptr<AudioRecorder> recorder_;
    std::unique_ptr<TranscriptionWorker> worker_;
    State state_{State::Idle};
    bool in_transition_{false};
    std::deque<Command> pending_;
    quint64 active_request_{}; // 0 when no request is in flight
    quint64 generation_{};     // bumped by cancel, so a late frame processor result is dropped
    std::optional<Outcome> outcome_;
    std::optional<QString> capture_error_;
    bool shut_down_{false};
};

std::ostream& operator << (std::ostream& os, AppEngine::State state);
std::ostream& operator << (std::ostream& os, AppEngine::Command cmd);

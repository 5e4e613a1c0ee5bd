#include <algorithm>
#include <array>
#include <cassert>
#include <mutex>

#include <QDir>
#include <QPointer>
#include <QSettings>
#include <QStandardPaths>
#include <QtConcurrent/QtConcurrent>

#include <qcoro/core/qcorofuture.h>

#include "AppEngine.h"
#include "AudioFrameProcessor.h"
#include "AudioRecorder.h"
#include "ModelLocator.h"
#include "TranscriptionWorker.h"

#include "logging.h"

using namespace std;

/*! Model search directories, shared with the worker thread. */
struct AppEngine::ModelPaths {
    void set(filesystem::path configured) {
        lock_guard lock{mutex};
        models_path = std::move(configured);
    }

    optional<filesystem::path> resolve(const string& name) const {
        ModelSearchConfig cfg;
        {
            lock_guard lock{mutex};
            if (!models_path.empty()) {
                cfg.extra_search_paths.push_back(models_path);
            }
        }

        const auto app_data = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        if (!app_data.isEmpty()) {
            cfg.extra_search_paths.emplace_back(QDir{app_data}.filePath("models").toStdString());
        }

        if (auto found = ModelLocator{std::move(cfg)}.find_model(name)) {
            return found->path;
        }
        return {};
    }

    mutable std::mutex mutex;
    filesystem::path models_path;
};

ostream& operator << (ostream& os, AppEngine::State state) {
    constexpr auto states = to_array<string_view>({
        "Idle",
        "Recording",
        "Processing"
    });

    return os << states.at(static_cast<size_t>(state));
}

ostream& operator << (ostream& os, AppEngine::Command cmd) {
    constexpr auto cmds = to_array<string_view>({
        "Start",
        "Stop",
        "Cancel",
        "ApplyConfig",
        "Complete",
        "Abort"
    });

    return os << cmds.at(static_cast<size_t>(cmd));
}

AppEngine::AppEngine(AppConfig config,
                     AudioInput &input,
                     std::shared_ptr<qdt::EngineBase> engine,
                     std::shared_ptr<const qdt::EngineLoadParams> loadParams,
                     QObject *parent)
    : QObject(parent)
    , config_{std::move(config)}
    , input_{input}
    , model_paths_{make_shared<ModelPaths>()}
{
    registerErrorMetaTypes();
    model_paths_->set(config_.modelsPath);

    recorder_ = make_unique<AudioRecorder>(input_);

    TranscriptionWorker::Config wcfg;
    wcfg.engine = std::move(engine);
    wcfg.load_params = std::move(loadParams);
    wcfg.threads = config_.threads;
    wcfg.cleanup_delay = config_.cleanupDelay;
    wcfg.resolver = [paths = model_paths_](const string& name) {
        return paths->resolve(name);
    };
    worker_ = make_unique<TranscriptionWorker>(std::move(wcfg));

    connect(recorder_.get(), &AudioRecorder::volumeChanged, this, [this](VolumeSample sample) {
        if (state_ == State::Recording) {
            emit volumeChanged(sample.value);
        }
    });

    connect(recorder_.get(), &AudioRecorder::captureFailed, this, &AppEngine::onCaptureFailed);

    connect(worker_.get(), &TranscriptionWorker::progress, this, [this](quint64 id, const QString& text) {
        if (id == active_request_) {
            emit transcriptionProgress(text);
        }
    });

    connect(worker_.get(), &TranscriptionWorker::resultReady, this, &AppEngine::onWorkerResult);
    connect(worker_.get(), &TranscriptionWorker::failed, this, &AppEngine::onWorkerFailed);
}

AppEngine::~AppEngine()
{
    shutdown(config_.shutdownTimeout);
}

void AppEngine::startRecording()
{
    LOG_INFO << "Starting recording";
    request(Command::Start);
}

void AppEngine::stopRecording()
{
    LOG_INFO << "Stopping recording";
    request(Command::Stop);
}

void AppEngine::toggleRecording()
{
    switch(state_) {
    case State::Idle:
        request(Command::Start);
        break;
    case State::Recording:
        request(Command::Stop);
        break;
    case State::Processing:
        LOG_DEBUG_N << "Ignoring toggle while processing";
        break;
    }
}

void AppEngine::cancelTranscription()
{
    LOG_INFO << "Cancelling";
    request(Command::Cancel);
}

void AppEngine::applyConfig(AppConfig config)
{
    pending_config_ = std::move(config);
    request(Command::ApplyConfig);
}

void AppEngine::preloadModel()
{
    if (!config_.preloadModel || shut_down_) {
        return;
    }

    if (!model_paths_->resolve(config_.modelName)) {
        LOG_INFO_N << "Model " << config_.modelName << " is not on disk. Not preloading it.";
        return;
    }

    LOG_DEBUG_N << "Preloading model " << config_.modelName;
    worker_->preload(config_.modelName);
}

bool AppEngine::shutdown(std::chrono::milliseconds timeout)
{
    if (shut_down_) {
        return true;
    }

    LOG_DEBUG_N << "Shutting down AppEngine";
    shut_down_ = true;
    pending_.clear();
    ++generation_;
    recorder_->abort();

    const auto ok = worker_->shutdown(timeout);
    active_request_ = 0;
    setState(State::Idle);
    return ok;
}

void AppEngine::request(Command cmd)
{
    if (shut_down_) {
        LOG_DEBUG_N << "Ignoring " << cmd << " after shutdown";
        return;
    }

    if (in_transition_) {
        if (find(pending_.begin(), pending_.end(), cmd) == pending_.end()) {
            LOG_TRACE_N << "Queuing " << cmd << " until the current transition is done";
            pending_.push_back(cmd);
        } else {
            LOG_TRACE_N << "Coalescing duplicate " << cmd;
        }
        return;
    }

    in_transition_ = true;
    try {
        dispatch(cmd);
        while (!pending_.empty() && !shut_down_) {
            const auto next = pending_.front();
            pending_.pop_front();
            dispatch(next);
        }
    } catch (const exception& ex) {
        LOG_ERROR_N << "Caught exception while handling " << cmd << ": " << ex.what();
        pending_.clear();
        in_transition_ = false;
        failed(tr("Internal error: %1").arg(QString::fromUtf8(ex.what())));
        return;
    }
    in_transition_ = false;
}

void AppEngine::dispatch(Command cmd)
{
    LOG_TRACE_N << "Handling " << cmd << " in state " << state_;

    switch(cmd) {
    case Command::Start:
        doStart();
        break;
    case Command::Stop:
        doStop();
        break;
    case Command::Cancel:
        doCancel();
        break;
    case Command::ApplyConfig:
        doApplyConfig();
        break;
    case Command::Complete:
        doComplete();
        break;
    case Command::Abort:
        doAbort();
        break;
    }
}

void AppEngine::doStart()
{
    if (state_ != State::Idle) {
        LOG_DEBUG_N << "Cannot start recording in state " << state_;
        return;
    }

    if (auto err = recorder_->start(config_.deviceId, config_.sampleRateMode)) {
        LOG_WARN_N << "Failed to start recording: " << err->reason.toStdString();
        emit captureFailed(err->reason);
        return;
    }

    setState(State::Recording);
}

void AppEngine::doStop()
{
    if (state_ != State::Recording) {
        LOG_DEBUG_N << "Cannot stop recording in state " << state_;
        return;
    }

    auto session = recorder_->stop();
    emit volumeChanged(0.0f);

    if (!session || session->empty()) {
        LOG_WARN_N << "No audio was recorded";
        emit captureFailed(tr("No audio was recorded"));
        setState(State::Idle);
        return;
    }

    LOG_DEBUG_EX(*session) << "Recording done";
    setState(State::Processing);
    processRecording(std::move(session));
}

void AppEngine::doCancel()
{
    switch(state_) {
    case State::Idle:
        LOG_DEBUG_N << "Nothing to cancel";
        return;
    case State::Recording:
        recorder_->abort();
        ++generation_;
        emit volumeChanged(0.0f);
        emit transcriptionFailed(QStringLiteral("cancelled"));
        setState(State::Idle);
        return;
    case State::Processing:
        if (active_request_) {
            // The worker ends the request with a Cancelled failure
            worker_->cancel();
            return;
        }

        // Still in the frame processor
        ++generation_;
        emit transcriptionFailed(QStringLiteral("cancelled"));
        setState(State::Idle);
        return;
    }
}

void AppEngine::doApplyConfig()
{
    if (!pending_config_) {
        return;
    }

    auto next = std::move(*pending_config_);
    pending_config_.reset();

    const bool model_changed = next.modelName != config_.modelName
                               || next.modelsPath != config_.modelsPath
                               || next.useGpu != config_.useGpu;

    config_ = std::move(next);
    model_paths_->set(config_.modelsPath);
    worker_->setThreads(config_.threads);
    worker_->setCleanupDelay(config_.cleanupDelay);

    if (model_changed) {
        LOG_INFO_N << "Model configuration changed to " << config_.modelName;
        worker_->invalidateModel();
    }

    emit configChanged();
}

void AppEngine::doComplete()
{
    if (!outcome_) {
        return;
    }

    auto outcome = std::move(*outcome_);
    outcome_.reset();

    if (state_ != State::Processing) {
        LOG_DEBUG_N << "Ignoring outcome of request #" << outcome.id << " in state " << state_;
        return;
    }

    active_request_ = 0;

    if (outcome.text) {
        LOG_INFO_N << "Transcription completed";
        emit transcriptionCompleted(*outcome.text);
        setState(State::Idle);
        return;
    }

    assert(outcome.failure);
    const auto& failure = *outcome.failure;
    LOG_WARN_N << "Transcription failed: " << failure;
    emit transcriptionFailed(failure.kind == TranscriptionFailure::Kind::Cancelled
                                 ? QStringLiteral("cancelled") : failure.reason);
    setState(State::Idle);
}

void AppEngine::doAbort()
{
    if (!capture_error_) {
        return;
    }

    const auto reason = std::move(*capture_error_);
    capture_error_.reset();

    if (state_ != State::Recording) {
        return;
    }

    ++generation_;
    emit volumeChanged(0.0f);
    emit captureFailed(reason);
    setState(State::Idle);
}

QCoro::Task<void> AppEngine::processRecording(std::unique_ptr<CaptureSession> session)
{
    QPointer<AppEngine> self = this;
    const auto generation = generation_;

    // Ask the device now, on our own thread, in case the processor needs it
    const auto device_rate = session->nativeSampleRate > 0 ? 0 : input_.defaultSampleRate(session->deviceId);
    shared_ptr<const CaptureSession> captured = std::move(session);

    auto audio = co_await QtConcurrent::run([captured, device_rate] {
        return AudioFrameProcessor::process(*captured, [device_rate](const QByteArray&) {
            return device_rate;
        });
    });

    if (!self || generation != generation_ || state_ != State::Processing) {
        LOG_DEBUG << "Discarding processed audio from a cancelled recording";
        co_return;
    }

    TranscriptionRequest req;
    req.audio = std::move(audio);
    req.languageHint = config_.language;
    req.modelName = config_.modelName;

    auto handle = worker_->submit(std::move(req));
    if (!handle) {
        outcome_ = Outcome{0, {}, TranscriptionFailure{TranscriptionFailure::Kind::Rejected,
                                                       tr("A transcription is already in progress")}};
        request(Command::Complete);
        co_return;
    }

    active_request_ = handle->id;
    LOG_DEBUG_N << "Submitted transcription request #" << active_request_;
}

void AppEngine::onWorkerResult(quint64 id, const QString &text)
{
    if (id != active_request_) {
        LOG_DEBUG_N << "Ignoring result of stale request #" << id;
        return;
    }

    outcome_ = Outcome{id, text, {}};
    request(Command::Complete);
}

void AppEngine::onWorkerFailed(quint64 id, const TranscriptionFailure &failure)
{
    if (id != active_request_) {
        LOG_DEBUG_N << "Ignoring failure of stale request #" << id << ": " << failure;
        return;
    }

    outcome_ = Outcome{id, {}, failure};
    request(Command::Complete);
}

void AppEngine::onCaptureFailed(const CaptureError &error)
{
    capture_error_ = error.reason;
    request(Command::Abort);
}

void AppEngine::failed(const QString &why)
{
    LOG_ERROR_N << "Operation failed: " << why.toStdString();
    if (state_ == State::Recording) {
        recorder_->abort();
    }
    if (state_ == State::Processing && active_request_) {
        worker_->cancel();
    }
    active_request_ = 0;
    ++generation_;
    emit transcriptionFailed(why);
    setState(State::Idle);
}

void AppEngine::setState(State newState)
{
    if (state_ != newState) {
        LOG_DEBUG_N << "State changed from " << state_ << " to " << newState;
        state_ = newState;
        emit stateChanged(newState);
    }
}

void AppEngine::initLogging()
{
    QSettings settings{};

    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

    if (const auto level = settings.value("logging/applevel", 4).toInt()) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(level)));
        LOG_INFO << "Logging to console";
    }

    auto level = settings.value("logging/level", 0).toInt();
    if (level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

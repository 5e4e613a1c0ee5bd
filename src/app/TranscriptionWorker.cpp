#include <array>
#include <cassert>
#include <condition_variable>
#include <format>
#include <string_view>

#include <QTimer>

#include "TranscriptionWorker.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

struct TranscriptionWorker::Impl {
    Impl(Config cfg, TranscriptionWorker *ownerPtr)
        : config{std::move(cfg)}, threads{config.threads}, owner{ownerPtr} {}

    void run() noexcept;
    bool ensureModelLoaded(const string& name, QString& error);
    bool transcribe(quint64 id, const TranscriptionRequest& request);
    bool transcribeImpl(quint64 id, const TranscriptionRequest& request);
    bool succeeded(quint64 id, const QString& text);
    bool failedWith(quint64 id, TranscriptionFailure::Kind kind, QString reason);
    void releaseSession();
    void releaseAll();

    // Emits through the owner, unless the owner gave up on us
    template <typename Fn>
    void notify(Fn&& fn) {
        lock_guard lock{owner_mutex};
        if (owner) {
            fn(*owner);
        }
    }

    const Config config;
    cmd_queue_t cmd_queue;
    atomic_bool busy{false};
    atomic_bool cancelled{false};
    atomic_bool invalidated{false};
    atomic_bool shutting_down{false};
    atomic<quint64> current_id{0};
    atomic<quint64> next_id{0};
    atomic_int threads;

    // Written only by the worker thread. Read by others under state_mutex.
    mutable mutex state_mutex;
    shared_ptr<qdt::ModelCtx> model;
    shared_ptr<qdt::SessionCtx> session;
    string model_name;

    mutex owner_mutex;
    TranscriptionWorker *owner{};

    mutex exit_mutex;
    condition_variable exit_cv;
    bool exited{false};
};

namespace logfault {
pair<bool /* json */, string /* content or json */> toLog(const TranscriptionWorker& w, bool json) {
    if (json) {
        return make_pair(true, format(R"("worker":{{"model":"{}", "busy":{}}})",
                                      w.loadedModelName(),
                                      w.isBusy()));
    }

    return make_pair(false, format("TranscriptionWorker{{model={}, busy={}}}",
                                   w.loadedModelName(),
                                   w.isBusy()));
}
} // logfault ns

ostream& operator<<(ostream &os, TranscriptionWorker::CmdType cmd) {
    constexpr auto cmds = to_array<string_view>({
        "PRELOAD",
        "TRANSCRIBE",
        "CLEANUP",
        "EXIT"
    });

    return os << cmds.at(static_cast<size_t>(cmd));
}

ostream& operator<<(ostream &os, const TranscriptionWorker::Operation& op) {
    return os << op.op();
}

TranscriptionWorker::TranscriptionWorker(Config config, QObject *parent)
    : QObject(parent)
    , cleanup_delay_{config.cleanup_delay}
{
    registerErrorMetaTypes();

    if (!config.engine) {
        throw runtime_error("TranscriptionWorker needs an inference engine");
    }

    impl_ = make_shared<Impl>(std::move(config), this);

    // Release the task-scoped session a little while after each request
    connect(this, &TranscriptionWorker::resultReady, this, [this] { scheduleCleanup(); });
    connect(this, &TranscriptionWorker::failed, this, [this] { scheduleCleanup(); });

    // The thread shares ownership of the state, so it can outlive us if it has to
    worker_.emplace([impl = impl_] { impl->run(); });
}

TranscriptionWorker::~TranscriptionWorker()
{
    LOG_DEBUG_EX(*this) << "Destroying transcription worker";
    shutdown();

    lock_guard lock{impl_->owner_mutex};
    impl_->owner = nullptr;
}

optional<TranscriptionWorker::Handle> TranscriptionWorker::submit(TranscriptionRequest request)
{
    if (!worker_ || impl_->shutting_down) {
        LOG_WARN_EX(*this) << "Rejecting transcription request. The worker is shutting down.";
        return {};
    }

    if (impl_->busy.exchange(true)) {
        LOG_WARN_EX(*this) << "Rejecting transcription request. Request #" << impl_->current_id.load()
                           << " is still in flight.";
        return {};
    }

    const auto id = ++impl_->next_id;
    impl_->cancelled = false;
    impl_->current_id = id;

    LOG_DEBUG_EX(*this) << "Queuing transcription #" << id << " of "
                        << request.audio.durationSeconds() << " s audio with model "
                        << request.modelName;

    auto op = make_unique<Operation>(CmdType::TRANSCRIBE,
        [impl = impl_.get(), id, request = std::move(request)]() {
            return impl->transcribe(id, request);
        });

    Handle handle{id, op->future()};
    enqueueCommand(std::move(op));
    return handle;
}

QFuture<bool> TranscriptionWorker::preload(string modelName)
{
    auto op = make_unique<Operation>(CmdType::PRELOAD,
        [impl = impl_.get(), name = std::move(modelName)]() {
            QString error;
            if (!impl->ensureModelLoaded(name, error)) {
                LOG_WARN_N << "Failed to preload model " << name << ": " << error.toStdString();
                return false;
            }
            return true;
        });

    auto future = op->future();
    if (!worker_ || impl_->shutting_down) {
        op->setResult(false);
        return future;
    }

    enqueueCommand(std::move(op));
    return future;
}

void TranscriptionWorker::cancel()
{
    if (impl_->busy) {
        LOG_DEBUG_EX(*this) << "Cancelling transcription #" << impl_->current_id.load();
        impl_->cancelled = true;
    }
}

void TranscriptionWorker::invalidateModel()
{
    LOG_DEBUG_EX(*this) << "Model invalidated";
    impl_->invalidated = true;
}

bool TranscriptionWorker::shutdown(std::chrono::milliseconds timeout)
{
    if (!worker_) {
        return true;
    }

    LOG_DEBUG_EX(*this) << "Shutting down transcription worker";
    impl_->shutting_down = true;
    impl_->cancelled = true;
    enqueueCommand(make_unique<Operation>(CmdType::EXIT));

    bool exited = false;
    {
        unique_lock lock{impl_->exit_mutex};
        exited = impl_->exit_cv.wait_for(lock, timeout, [this] { return impl_->exited; });
    }

    if (exited) {
        worker_->join();
        worker_.reset();
        LOG_DEBUG_EX(*this) << "Transcription worker thread joined.";
        return true;
    }

    LOG_ERROR_EX(*this) << "Transcription worker did not stop within " << timeout.count()
                        << " ms. Detaching the thread and leaving it behind.";
    {
        lock_guard lock{impl_->owner_mutex};
        impl_->owner = nullptr;
    }
    worker_->detach();
    worker_.reset();
    return false;
}

bool TranscriptionWorker::isBusy() const noexcept
{
    return impl_->busy;
}

string TranscriptionWorker::loadedModelName() const
{
    lock_guard lock{impl_->state_mutex};
    return impl_->model_name;
}

bool TranscriptionWorker::hasSession() const
{
    lock_guard lock{impl_->state_mutex};
    return impl_->session != nullptr;
}

quint64 TranscriptionWorker::currentId() const noexcept
{
    return impl_->current_id;
}

void TranscriptionWorker::setThreads(int threads)
{
    impl_->threads = threads;
}

void TranscriptionWorker::setCleanupDelay(std::chrono::milliseconds delay)
{
    cleanup_delay_ = delay;
}

void TranscriptionWorker::scheduleCleanup()
{
    QTimer::singleShot(cleanup_delay_, this, [this] {
        if (worker_ && !impl_->shutting_down) {
            enqueueCommand(make_unique<Operation>(CmdType::CLEANUP));
        }
    });
}

void TranscriptionWorker::enqueueCommand(std::unique_ptr<Operation> &&op)
{
    assert(op);
    LOG_TRACE_EX(*this) << "Enqueue command: " << *op;
    impl_->cmd_queue.push(std::move(op));
}

void TranscriptionWorker::Impl::run() noexcept
{
    LOG_DEBUG_N << "Transcription worker started";

    while(true) {
        cmd_queue_t::type_t op;
        if (!cmd_queue.pop(op) || !op) {
            LOG_ERROR_N << "No command received, exiting...";
            break;
        }

        LOG_TRACE_N << "Processing command: " << *op;

        const auto op_type = op->op();
        try {
            switch(op_type) {
            case CmdType::PRELOAD:
            case CmdType::TRANSCRIBE:
                // Execute will set the result
                op->execute();
                break;
            case CmdType::CLEANUP:
                releaseSession();
                op->setResult(true);
                break;
            case CmdType::EXIT:
                LOG_DEBUG_N << "Exit command received, stopping worker...";
                releaseAll();
                op->setResult(true);
                break;
            }
        } catch (const exception& ex) {
            LOG_ERROR_N << "Caught exception in command loop: " << ex.what();
            op->setResult(false);
        }

        if (op_type == CmdType::EXIT) {
            break;
        }
    }

    {
        lock_guard lock{exit_mutex};
        exited = true;
    }
    exit_cv.notify_all();
}

bool TranscriptionWorker::Impl::ensureModelLoaded(const string &name, QString &error)
{
    const bool was_invalidated = invalidated.exchange(false);
    if (model && model_name == name && !was_invalidated) {
        return true;
    }

    if (model) {
        LOG_INFO_N << "Unloading model " << model_name
                   << (was_invalidated ? " (invalidated)" : " (model changed)");
        lock_guard lock{state_mutex};
        session.reset();
        model.reset();
        model_name.clear();
    }

    if (name.empty()) {
        error = TranscriptionWorker::tr("No model is selected");
        return false;
    }

    const auto path = config.resolver ? config.resolver(name) : nullopt;
    if (!path) {
        error = TranscriptionWorker::tr("Model '%1' was not found").arg(QString::fromStdString(name));
        LOG_WARN_N << error.toStdString();
        return false;
    }

    LOG_INFO_N << "Loading model " << name << " from " << *path;
    ScopedTimer timer;

    const qdt::EngineLoadParams default_params;
    auto ctx = config.engine->load(name, *path, config.load_params ? *config.load_params : default_params);
    if (!ctx) {
        const auto why = config.engine->lastError();
        error = TranscriptionWorker::tr("Failed to load model '%1': %2")
                    .arg(QString::fromStdString(name), QString::fromStdString(why));
        LOG_WARN_N << error.toStdString();
        return false;
    }

    {
        lock_guard lock{state_mutex};
        model = std::move(ctx);
        model_name = name;
    }

    LOG_INFO_N << "Loaded " << model->info() << " in " << timer.elapsed() << " seconds";
    notify([&name](TranscriptionWorker& w) {
        emit w.modelLoaded(QString::fromStdString(name));
    });
    return true;
}

bool TranscriptionWorker::Impl::transcribe(quint64 id, const TranscriptionRequest &request)
{
    try {
        return transcribeImpl(id, request);
    } catch (const exception& ex) {
        LOG_ERROR_N << "Transcription #" << id << " threw: " << ex.what();
        return failedWith(id, TranscriptionFailure::Kind::Transcription, QString::fromUtf8(ex.what()));
    }
}

bool TranscriptionWorker::Impl::transcribeImpl(quint64 id, const TranscriptionRequest &request)
{
    if (cancelled) {
        return failedWith(id, TranscriptionFailure::Kind::Cancelled, QStringLiteral("cancelled"));
    }

    QString error;
    if (!ensureModelLoaded(request.modelName, error)) {
        return failedWith(id, TranscriptionFailure::Kind::ModelLoad, error);
    }

    if (request.audio.samples.empty()) {
        return failedWith(id, TranscriptionFailure::Kind::Transcription, QStringLiteral("no speech detected"));
    }

    if (!session) {
        auto s = model->createSession();
        if (!s) {
            return failedWith(id, TranscriptionFailure::Kind::Transcription,
                              TranscriptionWorker::tr("Failed to create a transcription session"));
        }

        lock_guard lock{state_mutex};
        session = std::move(s);
    }

    session->setOnPartialTextCallback([this, id](const string& text) {
        const auto partial = QString::fromStdString(text).trimmed();
        if (!partial.isEmpty()) {
            notify([&](TranscriptionWorker& w) {
                emit w.progress(id, partial);
            });
        }
    });

    session->setAbortCallback([this] {
        return cancelled.load();
    });

    qdt::TranscribeParams params;
    params.language = request.languageHint;
    params.threads = threads;
    params.sample_rate = request.audio.sampleRate;

    LOG_DEBUG_N << "Transcribing #" << id << ": " << request.audio.samples.size() << " samples, language="
                << (params.language.empty() ? "auto" : params.language);

    ScopedTimer timer;
    qdt::Transcript transcript;
    const bool ok = session->transcribe(request.audio.samples, params, transcript);

    if (cancelled) {
        LOG_DEBUG_N << "Transcription #" << id << " was cancelled. Discarding the result.";
        return failedWith(id, TranscriptionFailure::Kind::Cancelled, QStringLiteral("cancelled"));
    }

    if (!ok) {
        auto why = session->lastError();
        if (why.empty()) {
            why = "transcription failed";
        }
        return failedWith(id, TranscriptionFailure::Kind::Transcription, QString::fromStdString(why));
    }

    const auto text = QString::fromStdString(transcript.full_text).trimmed();
    if (text.isEmpty()) {
        return failedWith(id, TranscriptionFailure::Kind::Transcription, QStringLiteral("no speech detected"));
    }

    LOG_INFO_N << "Transcribed " << request.audio.durationSeconds() << " s of audio in "
               << timer.elapsed() << " s. Language: " << transcript.language;
    return succeeded(id, text);
}

bool TranscriptionWorker::Impl::succeeded(quint64 id, const QString &text)
{
    busy = false;
    notify([&](TranscriptionWorker& w) {
        emit w.resultReady(id, text);
    });
    return true;
}

bool TranscriptionWorker::Impl::failedWith(quint64 id, TranscriptionFailure::Kind kind, QString reason)
{
    TranscriptionFailure failure{kind, std::move(reason)};
    LOG_WARN_N << "Transcription #" << id << " failed: " << failure;

    busy = false;
    notify([&](TranscriptionWorker& w) {
        emit w.failed(id, failure);
    });
    return false;
}

void TranscriptionWorker::Impl::releaseSession()
{
    lock_guard lock{state_mutex};
    if (session) {
        LOG_DEBUG_N << "Releasing transcription session. Keeping model " << model_name;
        session.reset();
    }
}

void TranscriptionWorker::Impl::releaseAll()
{
    lock_guard lock{state_mutex};
    session.reset();
    if (model) {
        LOG_DEBUG_N << "Unloading model " << model_name;
        model.reset();
    }
    model_name.clear();
}

void TranscriptionWorker::Operation::execute() noexcept
{
    try {
        if (fn_) {
            const bool res = fn_();
            setResult(res);
            return;
        }

        setResult(true);
    } catch (const exception& ex) {
        setResult(false);
        LOG_WARN_N << "Exception during operation execution: " << ex.what();
    }
}

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <QObject>
#include <QFuture>
#include <QPromise>

#include "qdt/EngineBase.h"

#include "AudioTypes.h"
#include "Errors.h"
#include "Queue.h"

/*! Runs transcriptions on a dedicated worker thread.
 *
 *  Owns the engine's loaded model (at most one, keyed by name) and the
 *  task-scoped engine session. All engine calls happen on the worker thread,
 *  in the order the commands were queued.
 *
 *  At most one transcription is in flight. A submission while another one is
 *  queued or running is rejected. Every accepted submission ends with exactly
 *  one resultReady() or failed().
 *
 *  The thread's state is shared with the thread itself, so shutdown() can give
 *  up on an engine that hangs and leave the thread behind.
 */
class TranscriptionWorker : public QObject
{
    Q_OBJECT

public:
    using model_resolver_t = std::function<std::optional<std::filesystem::path>(const std::string& name)>;

    struct Config {
        std::shared_ptr<qdt::EngineBase> engine;
        model_resolver_t resolver;
        std::shared_ptr<const qdt::EngineLoadParams> load_params;
        int threads{-1};
        std::chrono::milliseconds cleanup_delay{1000};
    };

    // Command types for worker thread
    enum class CmdType {
        PRELOAD,
        TRANSCRIBE,
        CLEANUP,
        EXIT
    };

    class Operation {
    public:
        using fn_t = std::function<bool()>;

        Operation(CmdType type, fn_t && fn = {})
            : type_{type}, fn_{std::move(fn)}  {}

        ~Operation() {
            setResult(false); // If not set to true, default to false.
        }

        Operation(const Operation&) = delete;
        Operation& operator=(const Operation&) = delete;
        Operation(Operation&&) = delete;
        Operation& operator=(Operation&&) = delete;

        CmdType op() const noexcept { return type_; }

        void execute() noexcept;

        void setResult(bool ok) {
            std::call_once(promise_set_, [this, ok]() {
                promise_.start();
                promise_.addResult(ok);
                promise_.finish();
            });
        }

        QFuture<bool> future() noexcept {
            return promise_.future();
        }

    private:
        QPromise<bool> promise_;
        std::once_flag promise_set_;
        CmdType type_;
        fn_t fn_;
    };

    using cmd_queue_t = Queue<std::unique_ptr<Operation>>;

    struct Handle {
        quint64 id{};
        QFuture<bool> done; // true if a result was produced
    };

    explicit TranscriptionWorker(Config config, QObject *parent = nullptr);
    ~TranscriptionWorker() override;

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    /*! Queues a transcription.
     *
     *  @return A handle for the request, or nothing if it was rejected because
     *      another request is in flight or the worker is shutting down.
     */
    [[nodiscard]] std::optional<Handle> submit(TranscriptionRequest request);

    // Loads the model ahead of the first request. The future is true if it loaded.
    QFuture<bool> preload(std::string modelName);

    // Asks the current request to stop. It ends with a Cancelled failure.
    void cancel();

    // The next request reloads the model even if the name is unchanged
    void invalidateModel();

    /*! Stops the worker thread.
     *
     *  Cancels the current request and waits up to timeout for the thread to
     *  exit. If it does not, the thread is detached and left to finish on its
     *  own, and no more signals are emitted.
     *
     *  @return true if the thread exited in time.
     */
    bool shutdown(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    bool isBusy() const noexcept;
    bool isRunning() const noexcept { return worker_.has_value(); }
    std::string loadedModelName() const;
    bool hasSession() const;
    quint64 currentId() const noexcept;

    void setThreads(int threads);
    void setCleanupDelay(std::chrono::milliseconds delay);

signals:
    void progress(quint64 id, const QString& text);
    void resultReady(quint64 id, const QString& text);
    void failed(quint64 id, const TranscriptionFailure& failure);
    void modelLoaded(const QString& name);

private:
    struct Impl;

    void scheduleCleanup();
    void enqueueCommand(std::unique_ptr<Operation> && op);

    std::shared_ptr<Impl> impl_;
    std::optional<std::jthread> worker_;
    std::chrono::milliseconds cleanup_delay_;
};

std::ostream& operator << (std::ostream& os, TranscriptionWorker::CmdType cmd);
std::ostream& operator << (std::ostream& os, const TranscriptionWorker::Operation& op);

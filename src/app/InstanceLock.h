#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <ostream>

#include <QFile>
#include <QString>

/*! Cross-process single instance guard.
 *
 *  An advisory flock() on a file that holds the owner's PID. The lock goes
 *  away with the process, so a file left behind by a crash is recognized as
 *  stale and reclaimed.
 *
 *  If the lock directory cannot be created, falls back to scanning the
 *  process table for another process with the same executable name.
 */
class InstanceLock
{
public:
    enum class Result {
        Acquired,
        AlreadyRunning,
        Error
    };

    explicit InstanceLock(QString path, QString executableName = {});
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    Result tryAcquire();

    /*! Runs body only while holding the lock.
     *
     *  @return body's return value, or nullopt if the lock was not acquired.
     *      In that case body is never called.
     */
    std::optional<int> runExclusive(const std::function<int()>& body);

    // Unlocks and deletes the lock file. Safe to call more than once.
    void release();

    bool isHeld() const noexcept { return file_ != nullptr; }
    bool isDegraded() const noexcept { return degraded_; }
    const QString& path() const noexcept { return path_; }

    // <cache dir>/<application name>.lock
    static QString defaultPath();

    static bool isProcessAlive(qint64 pid);

    // Called between opening the lock file and locking it. For tests.
    void setBeforeLockHook(std::function<void()> hook) { before_lock_ = std::move(hook); }

    // True if another process runs an executable with this name
    static bool otherInstanceRunning(const QString& executableName);

private:
    Result fallbackScan();
    bool refersToPath(int fd) const;

    QString path_;
    QString executable_name_;
    std::unique_ptr<QFile> file_;
    bool degraded_{false};
    std::function<void()> before_lock_;
};

std::ostream& operator << (std::ostream& os, InstanceLock::Result result);

#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>

#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

#include "InstanceLock.h"
#include "logging.h"

using namespace std;

namespace {

// Linux truncates /proc/<pid>/comm to 15 characters
constexpr qsizetype max_comm_length = 15;

constexpr int max_lock_attempts = 5;

} // anon ns

ostream& operator << (ostream& os, InstanceLock::Result result) {
    constexpr auto results = to_array<string_view>({
        "Acquired",
        "AlreadyRunning",
        "Error"
    });

    return os << results.at(static_cast<size_t>(result));
}

InstanceLock::InstanceLock(QString path, QString executableName)
    : path_{std::move(path)}, executable_name_{std::move(executableName)}
{
    if (executable_name_.isEmpty()) {
        executable_name_ = QFileInfo{QCoreApplication::applicationFilePath()}.fileName();
    }
}

InstanceLock::~InstanceLock()
{
    release();
}

QString InstanceLock::defaultPath()
{
    auto dir = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (dir.isEmpty()) {
        dir = QDir::tempPath();
    }

    auto name = QCoreApplication::applicationName().toLower();
    if (name.isEmpty()) {
        name = QStringLiteral("qdictate");
    }

    return QDir{dir}.filePath(name + QStringLiteral(".lock"));
}

bool InstanceLock::isProcessAlive(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }

    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }

    // The process exists but belongs to someone else
    return errno == EPERM;
}

bool InstanceLock::otherInstanceRunning(const QString &executableName)
{
    const auto wanted = executableName.left(max_comm_length).toUtf8();
    const auto self = static_cast<qint64>(::getpid());

    QDir proc{QStringLiteral("/proc")};
    for (const auto& entry : proc.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        bool ok = false;
        const auto pid = entry.toLongLong(&ok);
        if (!ok || pid == self) {
            continue;
        }

        QFile comm{proc.filePath(entry + QStringLiteral("/comm"))};
        if (!comm.open(QIODevice::ReadOnly)) {
            continue; // gone, or not ours to read
        }

        if (comm.readAll().trimmed() == wanted) {
            LOG_INFO_N << "Found another " << executableName.toStdString() << " process: PID " << pid;
            return true;
        }
    }

    return false;
}

InstanceLock::Result InstanceLock::fallbackScan()
{
    degraded_ = true;
    LOG_WARN_N << "Falling back to a process scan for " << executable_name_.toStdString();
    return otherInstanceRunning(executable_name_) ? Result::AlreadyRunning : Result::Acquired;
}

InstanceLock::Result InstanceLock::tryAcquire()
{
    if (isHeld()) {
        return Result::Acquired;
    }

    const QFileInfo info{path_};
    if (!QDir{}.mkpath(info.absolutePath())) {
        LOG_ERROR_N << "Failed to create lock directory " << info.absolutePath().toStdString();
        return fallbackScan();
    }

    for (auto attempt = 1; attempt <= max_lock_attempts; ++attempt) {
        auto file = make_unique<QFile>(path_);
        if (!file->open(QIODevice::ReadWrite)) {
            if (!QFile::exists(path_)) {
                LOG_ERROR_N << "Failed to create lock file " << path_.toStdString()
                            << ": " << file->errorString().toStdString();
                return Result::Error;
            }

            LOG_WARN_N << "Cannot open existing lock file " << path_.toStdString()
                       << ": " << file->errorString().toStdString() << ". Removing it.";
            if (!QFile::remove(path_)) {
                LOG_ERROR_N << "Failed to remove unreadable lock file " << path_.toStdString();
                return Result::Error;
            }
            continue;
        }

        if (before_lock_) {
            before_lock_();
        }

        if (::flock(file->handle(), LOCK_EX | LOCK_NB) != 0) {
            const auto err = errno;
            if (err == EWOULDBLOCK) {
                LOG_INFO_N << "Lock file " << path_.toStdString() << " is held by another process";
                return Result::AlreadyRunning;
            }

            LOG_ERROR_N << "flock() failed on " << path_.toStdString() << ": " << strerror(err);
            return Result::Error;
        }

        // Another process may have removed or replaced the file between open() and flock()
        if (!refersToPath(file->handle())) {
            LOG_DEBUG_N << "Lock file " << path_.toStdString() << " was replaced while locking it. Retrying.";
            ::flock(file->handle(), LOCK_UN);
            continue;
        }

        if (const auto content = file->readAll().trimmed(); !content.isEmpty()) {
            // Nobody holds it. The previous owner is gone.
            bool ok = false;
            const auto pid = content.toLongLong(&ok);
            if (ok && pid > 0 && isProcessAlive(pid)) {
                LOG_WARN_N << "Found process " << pid << " but the lock file was not locked. Assuming stale lock.";
            } else {
                LOG_INFO_N << "Removing stale lock file for PID " << (ok ? pid : 0);
            }

            // Removed while we still hold it, so a contender that opened it
            // before us sees the replacement and retries.
            const auto removed = QFile::remove(path_);
            ::flock(file->handle(), LOCK_UN);
            if (!removed) {
                LOG_ERROR_N << "Failed to remove stale lock file " << path_.toStdString();
                return Result::Error;
            }
            continue;
        }

        const auto pid = QByteArray::number(static_cast<qint64>(::getpid()));
        if (!file->resize(0) || !file->seek(0) || file->write(pid) != pid.size() || !file->flush()) {
            LOG_ERROR_N << "Failed to write PID to " << path_.toStdString() << ": " << file->errorString().toStdString();
            QFile::remove(path_);
            ::flock(file->handle(), LOCK_UN);
            return Result::Error;
        }

        file_ = std::move(file);
        LOG_INFO_N << "Acquired lock file " << path_.toStdString() << " for PID " << pid.toStdString();
        return Result::Acquired;
    }

    LOG_ERROR_N << "Gave up on " << path_.toStdString() << " after " << max_lock_attempts
                << " attempts. The file keeps changing.";
    return Result::Error;
}

bool InstanceLock::refersToPath(int fd) const
{
    struct stat by_fd{};
    struct stat by_path{};
    if (::fstat(fd, &by_fd) != 0 || ::stat(QFile::encodeName(path_).constData(), &by_path) != 0) {
        return false;
    }

    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

optional<int> InstanceLock::runExclusive(const std::function<int()> &body)
{
    switch(tryAcquire()) {
    case Result::Acquired:
        break;
    case Result::AlreadyRunning:
        LOG_ERROR_N << "Another instance is already running";
        return {};
    case Result::Error:
        LOG_ERROR_N << "Failed to check for another instance. Assuming one is running.";
        return {};
    }

    const auto rval = body();
    release();
    return rval;
}

void InstanceLock::release()
{
    if (!file_) {
        return;
    }

    // Remove before unlocking. Whoever grabs the old inode after us sees it unlinked.
    const auto removed = QFile::remove(path_);
    ::flock(file_->handle(), LOCK_UN);
    file_->close();
    file_.reset();

    if (!removed) {
        LOG_WARN_N << "Failed to remove lock file " << path_.toStdString();
        return;
    }

    LOG_INFO_N << "Released application lock file";
}

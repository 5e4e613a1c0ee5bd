#include <unistd.h>

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "InstanceLock.h"

using namespace std;

namespace {

QByteArray readFile(const QString& path) {
    QFile f{path};
    if (!f.open(QIODevice::ReadOnly)) {
        return {};
    }
    return f.readAll().trimmed();
}

void writeFile(const QString& path, const QByteArray& data) {
    QFile f{path};
    ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    ASSERT_EQ(f.write(data), data.size());
}

const QByteArray ourPid = QByteArray::number(static_cast<qint64>(::getpid()));

} // anon ns

TEST(InstanceLock, AcquireWritesPidAndReleaseRemovesFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    InstanceLock lock{path};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_TRUE(lock.isHeld());
    EXPECT_FALSE(lock.isDegraded());
    EXPECT_TRUE(QFile::exists(path));
    EXPECT_EQ(readFile(path), ourPid);

    lock.release();
    EXPECT_FALSE(lock.isHeld());
    EXPECT_FALSE(QFile::exists(path));

    // Idempotent
    lock.release();
    EXPECT_FALSE(QFile::exists(path));
}

TEST(InstanceLock, CreatesMissingDirectory) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("nested/deeper/app.lock");

    InstanceLock lock{path};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_TRUE(QFile::exists(path));
}

TEST(InstanceLock, SecondHolderSeesAlreadyRunning) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    InstanceLock first{path};
    ASSERT_EQ(first.tryAcquire(), InstanceLock::Result::Acquired);

    // flock() conflicts between separate open file descriptions, even in one process
    InstanceLock second{path};
    EXPECT_EQ(second.tryAcquire(), InstanceLock::Result::AlreadyRunning);
    EXPECT_FALSE(second.isHeld());

    // The loser must not have removed the winner's file
    EXPECT_TRUE(QFile::exists(path));
    EXPECT_EQ(readFile(path), ourPid);

    first.release();
    EXPECT_EQ(second.tryAcquire(), InstanceLock::Result::Acquired);
}

TEST(InstanceLock, ReclaimsStaleLockFromDeadProcess) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    // Above any pid_max Linux allows
    writeFile(path, "99999999");

    InstanceLock lock{path};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_EQ(readFile(path), ourPid);
}

TEST(InstanceLock, ReclaimsUnlockedFileEvenIfPidIsAlive) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    // The parent is alive, but does not hold the lock
    writeFile(path, QByteArray::number(static_cast<qint64>(::getppid())));

    InstanceLock lock{path};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_EQ(readFile(path), ourPid);
}

TEST(InstanceLock, ReclaimsGarbageLockFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    writeFile(path, "not a pid");

    InstanceLock lock{path};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_EQ(readFile(path), ourPid);
}

TEST(InstanceLock, DestructorReleases) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    {
        InstanceLock lock{path};
        ASSERT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    }

    EXPECT_FALSE(QFile::exists(path));
}

TEST(InstanceLock, FallsBackToProcessScanWhenDirectoryCannotBeCreated) {
    // Nobody, not even root, can create directories in /proc
    InstanceLock lock{"/proc/qdictate-no-such-dir/app.lock", "qdt-nonexistent"};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_TRUE(lock.isDegraded());
    EXPECT_FALSE(lock.isHeld());
}

TEST(InstanceLock, ProcessScanFindsOtherProcess) {
    QFile comm{"/proc/1/comm"};
    if (::getpid() == 1 || !comm.open(QIODevice::ReadOnly)) {
        GTEST_SKIP() << "No readable process 1";
    }
    const auto name = QString::fromUtf8(comm.readAll().trimmed());
    ASSERT_FALSE(name.isEmpty());

    EXPECT_TRUE(InstanceLock::otherInstanceRunning(name));

    InstanceLock lock{"/proc/qdictate-no-such-dir/app.lock", name};
    EXPECT_EQ(lock.tryAcquire(), InstanceLock::Result::AlreadyRunning);
    EXPECT_TRUE(lock.isDegraded());
}

TEST(InstanceLock, IsProcessAlive) {
    EXPECT_TRUE(InstanceLock::isProcessAlive(::getpid()));
    EXPECT_FALSE(InstanceLock::isProcessAlive(0));
    EXPECT_FALSE(InstanceLock::isProcessAlive(-5));
    EXPECT_FALSE(InstanceLock::isProcessAlive(99999999));
}

TEST(InstanceLock, FileReplacedBeforeLockingIsNotTrusted) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    InstanceLock winner{path};
    InstanceLock loser{path};

    // The loser has opened its file. Before it can lock it, another instance
    // removes that file and acquires a new one in its place.
    auto interleaved = false;
    loser.setBeforeLockHook([&] {
        if (interleaved) {
            return;
        }
        interleaved = true;
        QFile::remove(path);
        EXPECT_EQ(winner.tryAcquire(), InstanceLock::Result::Acquired);
    });

    EXPECT_EQ(loser.tryAcquire(), InstanceLock::Result::AlreadyRunning);
    EXPECT_TRUE(interleaved);
    EXPECT_TRUE(winner.isHeld());
    EXPECT_FALSE(loser.isHeld());
    EXPECT_TRUE(QFile::exists(path));
    EXPECT_EQ(readFile(path), ourPid);
}

TEST(InstanceLock, ConcurrentStaleReclaimKeepsOneOwner) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    writeFile(path, "99999999");

    InstanceLock first{path};
    InstanceLock second{path};

    // Both found the same stale file. The first one reclaims it while the
    // second still has the old file open.
    auto interleaved = false;
    second.setBeforeLockHook([&] {
        if (interleaved) {
            return;
        }
        interleaved = true;
        EXPECT_EQ(first.tryAcquire(), InstanceLock::Result::Acquired);
    });

    EXPECT_EQ(second.tryAcquire(), InstanceLock::Result::AlreadyRunning);
    EXPECT_TRUE(interleaved);
    EXPECT_TRUE(first.isHeld());
    EXPECT_FALSE(second.isHeld());

    // The second must not have removed the first one's file
    EXPECT_TRUE(QFile::exists(path));
    EXPECT_EQ(readFile(path), ourPid);
}

TEST(InstanceLock, ContenderWaitingOnReleasedFileStartsOver) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    InstanceLock owner{path};
    ASSERT_EQ(owner.tryAcquire(), InstanceLock::Result::Acquired);

    // Opens the owner's file, which is released before the lock is taken
    InstanceLock next{path};
    auto interleaved = false;
    next.setBeforeLockHook([&] {
        if (interleaved) {
            return;
        }
        interleaved = true;
        owner.release();
    });

    EXPECT_EQ(next.tryAcquire(), InstanceLock::Result::Acquired);
    EXPECT_TRUE(interleaved);
    EXPECT_TRUE(QFile::exists(path));
    EXPECT_EQ(readFile(path), ourPid);

    next.release();
    EXPECT_FALSE(QFile::exists(path));
}

TEST(InstanceLock, RunExclusiveSkipsBodyWhenAnotherInstanceRuns) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    InstanceLock other{path};
    ASSERT_EQ(other.tryAcquire(), InstanceLock::Result::Acquired);

    auto called = false;
    InstanceLock lock{path};
    const auto rval = lock.runExclusive([&] {
        called = true;
        return 0;
    });

    EXPECT_FALSE(rval.has_value());
    EXPECT_FALSE(called);
    EXPECT_TRUE(other.isHeld());
}

TEST(InstanceLock, RunExclusiveHoldsTheLockForTheBody) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = dir.filePath("app.lock");

    InstanceLock lock{path};
    const auto rval = lock.runExclusive([&] {
        EXPECT_TRUE(lock.isHeld());
        EXPECT_EQ(InstanceLock{path}.tryAcquire(), InstanceLock::Result::AlreadyRunning);
        return 42;
    });

    ASSERT_TRUE(rval.has_value());
    EXPECT_EQ(*rval, 42);
    EXPECT_FALSE(lock.isHeld());
    EXPECT_FALSE(QFile::exists(path));
}

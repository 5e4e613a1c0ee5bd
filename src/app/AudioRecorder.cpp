#include <array>
#include <cassert>
#include <format>
#include <memory>
#include <string_view>

#include "AudioRecorder.h"
#include "ScopedTimer.h"

#include "logging.h"

using namespace std;

namespace logfault {
pair<bool /* json */, string /* content or json */> toLog(const AudioRecorder& r, bool json) {
    if (json) {
        return make_pair(true, format(R"("recorder":{{"state":"{}", "rate":{}}})",
                                      r.isRunning() ? "STARTED" : "STOPPED",
                                      r.sampleRate()));
    }

    return make_pair(false, format("AudioRecorder{{state={}, rate={}}}",
                                   r.isRunning() ? "STARTED" : "STOPPED",
                                   r.sampleRate()));
}

pair<bool /* json */, string /* content or json */> toLog(const CaptureSession& s, bool json) {
    if (json) {
        return make_pair(true, format(R"("session":{{"device":"{}", "rate":{}, "frames":{}, "samples":{}}})",
                                      s.deviceId.toStdString(),
                                      s.nativeSampleRate,
                                      s.frames.size(),
                                      s.numSamples()));
    }

    return make_pair(false, format("CaptureSession{{device={}, rate={}, frames={}, samples={}}}",
                                   s.deviceId.toStdString(),
                                   s.nativeSampleRate,
                                   s.frames.size(),
                                   s.numSamples()));
}
} // logfault ns

ostream& operator << (ostream& os, AudioRecorder::State state) {
    constexpr auto states = to_array<string_view>({
        "STOPPED",
        "STARTED"
    });

    return os << states.at(static_cast<size_t>(state));
}

AudioRecorder::AudioRecorder(AudioInput &input, QObject *parent)
    : QObject(parent)
    , input_(input)
    , capture_device_(&ring_)
{
    registerErrorMetaTypes();

    connect(&capture_device_, &AudioCaptureDevice::volumeChanged,
            this, &AudioRecorder::volumeChanged);

    // The input may be inside its own signal emission here. It is only
    // stopped later, from the event loop, and only for the session it failed.
    connect(&input_, &AudioInput::streamError, this, [this](const QString& reason, bool fatal) {
        QMetaObject::invokeMethod(this, [this, session = session_id_.load(), reason, fatal] {
            onStreamError(session, reason, fatal);
        }, Qt::QueuedConnection);
    }, Qt::DirectConnection);
}

AudioRecorder::~AudioRecorder()
{
    abort();
}

optional<DeviceError> AudioRecorder::start(const QByteArray &deviceId, SampleRateMode mode)
{
    LOG_DEBUG_EX(*this) << "Starting audio recorder on '" << deviceId.toStdString() << "' mode=" << mode;
    if (isRunning()) {
        LOG_WARN_EX(*this) << "Audio recorder already running";
        return DeviceError{tr("Recording is already in progress")};
    }

    ring_.reset();
    if (!capture_device_.open(QIODevice::WriteOnly)) {
        return DeviceError{tr("Failed to open the capture buffer")};
    }

    int rate = 0;
    if (auto err = input_.open(deviceId, mode, &capture_device_, rate)) {
        capture_device_.close();
        ring_.stop();
        ring_.reset();
        return err;
    }

    auto session = make_unique<CaptureSession>();
    session->deviceId = deviceId;
    session->nativeSampleRate = rate;
    session->channelCount = 1;
    session->isActive = true;
    session_ = std::move(session);
    sample_rate_ = rate;
    ++session_id_;

    accumulator_ = std::jthread([this] { accumulate(); });

    setState(State::STARTED);
    emit started();
    return {};
}

unique_ptr<CaptureSession> AudioRecorder::stop()
{
    LOG_DEBUG_EX(*this) << "Stopping audio recorder";
    if (!isRunning()) {
        LOG_DEBUG_EX(*this) << "Audio recorder not running";
        return {};
    }

    finishCapture();

    auto session = std::move(session_);
    session->isActive = false;
    LOG_DEBUG_EX(*session) << "Capture session sealed";

    emit stopped();
    return session;
}

void AudioRecorder::abort()
{
    if (!isRunning()) {
        return;
    }

    LOG_DEBUG_EX(*this) << "Aborting audio recorder";
    finishCapture();
    session_.reset();
    emit stopped();
}

void AudioRecorder::finishCapture()
{
    ScopedTimer timer;

    setState(State::STOPPED);
    input_.stop();
    capture_device_.close(); // flushes the partial chunk
    ring_.stop();            // unblock the accumulator once drained

    if (accumulator_.joinable()) {
        accumulator_.join();
    }

    if (const auto overflows = ring_.overflows()) {
        LOG_WARN_EX(*this) << "Lost " << overflows << " chunks to ring buffer overflow during capture";
    }

    LOG_TRACE_EX(*this) << "Capture finished in " << timer.elapsedMs() << " ms";
}

void AudioRecorder::accumulate()
{
    assert(session_);
    AudioRingBuffer::Chunk chunk;
    auto segment = 0u;

    quint64 samples = 0;

    while (ring_.pop(chunk)) {
        LOG_TRACE_N << "Accumulating #" << ++segment << " size=" << chunk.size();
        samples += static_cast<quint64>(chunk.size()) / sizeof(qint16);
        session_->frames.push_back(std::move(chunk));
        chunk = {};
        emit framesCaptured(samples);
    }

    LOG_DEBUG_N << "Frame accumulator done after " << segment << " chunks";
}

void AudioRecorder::onStreamError(quint64 session, const QString &reason, bool fatal)
{
    if (!isRunning() || session != session_id_) {
        LOG_DEBUG_EX(*this) << "Ignoring stream error from an earlier session: " << reason.toStdString();
        return;
    }

    if (!fatal) {
        LOG_DEBUG_EX(*this) << "Recoverable stream error: " << reason.toStdString();
        return;
    }

    LOG_WARN_EX(*this) << "Capture failed: " << reason.toStdString();
    abort();
    emit captureFailed(CaptureError{reason});
}

void AudioRecorder::setState(State state)
{
    if (state_ != state) {
        LOG_DEBUG_N << "AudioRecorder state changed from " << state_ << " to " << state;
        state_ = state;
    }
}

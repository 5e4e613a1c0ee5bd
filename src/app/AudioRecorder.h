#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <thread>

#include <QObject>
#include <QByteArray>

#include "AudioCaptureDevice.h"
#include "AudioInput.h"
#include "AudioRingBuffer.h"
#include "AudioTypes.h"
#include "Errors.h"

/*! Capture engine.
 *
 *  Opens the audio input, lets the capture device feed the ring buffer from
 *  the audio thread, and runs a frame accumulator thread that drains the
 *  ring into the current CaptureSession. stop() hands the sealed session
 *  over by unique ownership.
 *
 *  Must be used from the thread that owns it.
 */
class AudioRecorder : public QObject
{
    Q_OBJECT

public:
    enum class State {
        STOPPED,
        STARTED
    };

    explicit AudioRecorder(AudioInput& input, QObject *parent = nullptr);
    ~AudioRecorder() override;

    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    /*! Starts a new capture session.
     *
     *  @return A DeviceError if the input could not be opened. No session
     *      exists in that case.
     */
    [[nodiscard]] std::optional<DeviceError> start(const QByteArray& deviceId, SampleRateMode mode);

    /*! Stops the stream, drains the ring buffer and seals the session.
     *
     *  Returns nullptr if not recording. The returned session may be empty.
     */
    std::unique_ptr<CaptureSession> stop();

    // Stops and discards the current session, if any
    void abort();

    State state() const noexcept { return state_;}
    bool isRunning() const noexcept { return state_ == State::STARTED;}
    int sampleRate() const noexcept { return sample_rate_; }
    const AudioRingBuffer& ringBuffer() const noexcept { return ring_; }
    AudioCaptureDevice *captureDevice() noexcept { return &capture_device_; }

signals:
    void started();
    void stopped();
    void volumeChanged(VolumeSample sample);

    // Emitted from the accumulator thread for each chunk added to the session
    void framesCaptured(quint64 totalSamples);

    void captureFailed(CaptureError error);

private:
    void accumulate();
    void finishCapture();
    void onStreamError(quint64 session, const QString& reason, bool fatal);
    void setState(State state);

    AudioInput& input_;
    AudioRingBuffer ring_;
    AudioCaptureDevice capture_device_;
    std::unique_ptr<CaptureSession> session_;
    std::jthread accumulator_;
    State state_{State::STOPPED};
    int sample_rate_{};
    std::atomic<quint64> session_id_{0};
};

std::ostream& operator << (std::ostream& os, AudioRecorder::State state);

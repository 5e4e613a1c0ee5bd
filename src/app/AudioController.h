#pragma once

#include <memory>

#include <QMediaDevices>
#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSource>

#include "AudioInput.h"

class AudioController : public AudioInput
{
    Q_OBJECT

public:
    explicit AudioController(QObject *parent = nullptr);
    ~AudioController() override;

    const QList<QAudioDevice> inputDevices() const { return media_devices_.audioInputs(); }

    std::optional<DeviceError> open(const QByteArray& deviceId,
                                    SampleRateMode mode,
                                    QIODevice *sink,
                                    int& chosenRate) override;
    void stop() override;
    int defaultSampleRate(const QByteArray& deviceId) const override;

    // Empty id means the system default. Returns a null device if not found.
    QAudioDevice findDevice(const QByteArray& deviceId) const;

    static QAudioFormat createFormat(const QAudioDevice &device, SampleRateMode mode);

signals:
    void inputDevicesChanged();

private:
    void onStateChanged(QAudio::State state);
    void printDevices();

    QMediaDevices media_devices_;
    std::unique_ptr<QAudioSource> source_;
};

#pragma once

#include <optional>

#include <QObject>
#include <QByteArray>
#include <QString>

#include "AudioTypes.h"
#include "Errors.h"

class QIODevice;

/*! Source of raw PCM for the recorder.
 *
 *  The implementation pushes signed 16 bit mono samples into the sink
 *  device from its own thread until stop() is called. AudioController is
 *  the Qt Multimedia implementation. Tests use a fake one.
 */
class AudioInput : public QObject
{
    Q_OBJECT

public:
    explicit AudioInput(QObject *parent = nullptr) : QObject(parent) {}
    ~AudioInput() override = default;

    /*! Opens the device and starts pushing audio into sink.
     *
     *  @param deviceId Device to open. Empty for the system default.
     *  @param mode How to choose the sample rate.
     *  @param sink Open, writable device that receives the PCM.
     *  @param chosenRate Set to the rate the stream actually runs at.
     *  @return A DeviceError if the device is unknown or refuses to open.
     *      Nothing is left running in that case.
     */
    virtual std::optional<DeviceError> open(const QByteArray& deviceId,
                                            SampleRateMode mode,
                                            QIODevice *sink,
                                            int& chosenRate) = 0;

    virtual void stop() = 0;

    // 0 if the device is unknown
    virtual int defaultSampleRate(const QByteArray& deviceId) const = 0;

signals:
    // fatal is false for errors the stream recovers from by itself (underrun)
    void streamError(const QString& reason, bool fatal);
};

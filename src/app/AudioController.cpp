#include <cassert>

#include "AudioController.h"
#include "logging.h"

using namespace std;

namespace {

QString toReason(QAudio::Error error) {
    switch(error) {
    case QAudio::NoError:
        return {};
    case QAudio::OpenError:
        return QStringLiteral("audio device could not be opened");
    case QAudio::IOError:
        return QStringLiteral("audio device I/O error");
    case QAudio::UnderrunError:
        return QStringLiteral("audio buffer underrun");
    case QAudio::FatalError:
        return QStringLiteral("fatal audio device error");
    }
    return QStringLiteral("unknown audio error");
}

} // anon ns

AudioController::AudioController(QObject *parent)
    : AudioInput(parent)
{
    LOG_DEBUG_N << "Available audio input devices: ";
    printDevices();

    connect(&media_devices_, &QMediaDevices::audioInputsChanged,
            this, [this]{
        LOG_INFO_N << "Audio input devices changed " << media_devices_.audioInputs().size();
        printDevices();
        emit inputDevicesChanged();
    });
}

AudioController::~AudioController()
{
    stop();
}

QAudioDevice AudioController::findDevice(const QByteArray &deviceId) const
{
    if (deviceId.isEmpty()) {
        return QMediaDevices::defaultAudioInput();
    }

    for(const auto &dev : media_devices_.audioInputs()) {
        if (dev.id() == deviceId) {
            return dev;
        }
    }

    return {};
}

int AudioController::defaultSampleRate(const QByteArray &deviceId) const
{
    const auto dev = findDevice(deviceId);
    if (dev.isNull()) {
        return 0;
    }
    return dev.preferredFormat().sampleRate();
}

QAudioFormat AudioController::createFormat(const QAudioDevice &device, SampleRateMode mode)
{
    QAudioFormat format;
    format.setChannelCount(1);                   // mono
    format.setSampleFormat(QAudioFormat::Int16); // 16-bit signed PCM

    if (mode == SampleRateMode::Fixed) {
        format.setSampleRate(TARGET_SAMPLE_RATE);
        if (device.isFormatSupported(format)) {
            return format;
        }
        LOG_WARN_N << "Device " << device.description().toStdString() << " does not support "
                   << TARGET_SAMPLE_RATE << " Hz, using its native rate";
    }

    format.setSampleRate(device.preferredFormat().sampleRate());
    return format;
}

optional<DeviceError> AudioController::open(const QByteArray &deviceId,
                                            SampleRateMode mode,
                                            QIODevice *sink,
                                            int &chosenRate)
{
    assert(sink);

    if (source_) {
        LOG_WARN_N << "Audio input is already open";
        return DeviceError{tr("Audio input is already open")};
    }

    const auto device = findDevice(deviceId);
    if (device.isNull()) {
        LOG_WARN_N << "Audio input device not found: '" << deviceId.toStdString() << "'";
        return DeviceError{tr("Audio input device not found: %1")
                               .arg(deviceId.isEmpty() ? tr("(default)") : QString::fromUtf8(deviceId))};
    }

    const auto format = createFormat(device, mode);
    if (!device.isFormatSupported(format)) {
        LOG_WARN_N << "Device " << device.description().toStdString() << " does not support 16 bit mono at "
                   << format.sampleRate() << " Hz";
        return DeviceError{tr("%1 does not support 16 bit mono capture").arg(device.description())};
    }

    LOG_INFO_N << "Opening " << device.description().toStdString() << " at " << format.sampleRate() << " Hz";

    source_ = make_unique<QAudioSource>(device, format);
    connect(source_.get(), &QAudioSource::stateChanged, this, &AudioController::onStateChanged);

    source_->start(sink); // push mode

    if (const auto err = source_->error(); err != QAudio::NoError) {
        const auto reason = toReason(err);
        LOG_WARN_N << "Failed to start " << device.description().toStdString() << ": " << reason.toStdString();
        source_->disconnect(this);
        source_.reset();
        return DeviceError{reason};
    }

    chosenRate = format.sampleRate();
    return {};
}

void AudioController::stop()
{
    if (source_) {
        LOG_DEBUG_N << "Stopping audio input";
        source_->disconnect(this);
        source_->stop();
        // We may be called from a slot connected to the source's own signals
        source_.release()->deleteLater();
    }
}

void AudioController::onStateChanged(QAudio::State state)
{
    if (!source_) {
        return;
    }

    const auto err = source_->error();
    LOG_TRACE_N << "Audio source state " << static_cast<int>(state) << " error " << static_cast<int>(err);

    if (err == QAudio::NoError) {
        return;
    }

    const auto reason = toReason(err);
    if (err == QAudio::UnderrunError) {
        LOG_DEBUG_N << "Ignoring recoverable audio error: " << reason.toStdString();
        emit streamError(reason, false);
        return;
    }

    LOG_WARN_N << "Audio stream failed: " << reason.toStdString();
    emit streamError(reason, true);
}

void AudioController::printDevices()
{
    const auto def = QMediaDevices::defaultAudioInput();
    auto ix = 0u;
    for(const auto &dev : media_devices_.audioInputs()) {
        const bool is_default = (dev.id() == def.id());
        LOG_DEBUG_N << "  #" << ix << (is_default ? " * " : " : ") << dev.description().toStdString()
                    << " id=" << dev.id().toStdString()
                    << " rate=" << dev.preferredFormat().sampleRate();
        ++ix;
    }
}

#include <algorithm>
#include <cassert>
#include <cmath>

#include "AudioCaptureDevice.h"

#include "logging.h"
using namespace std;


AudioCaptureDevice::AudioCaptureDevice(AudioRingBuffer *ring, QObject *parent)
    : QIODevice(parent),
    ring_(ring)
{
    assert(ring_);
    prepareBuffer();
}

bool AudioCaptureDevice::open(OpenMode mode)
{
    LOG_DEBUG_N << "Opening AudioCaptureDevice in mode " << static_cast<int>(mode);
    if (!(mode & WriteOnly)) {
        LOG_ERROR_N << "AudioCaptureDevice can only be opened in WriteOnly mode";
        return false;
    }

    prepareBuffer();
    chunk_start_time_ = chrono::steady_clock::now();
    chunks_pushed_ = 0;
    chunks_dropped_ = 0;

    const auto res = QIODevice::open(mode);
    if (!res) {
        LOG_ERROR_N << "Failed to open AudioCaptureDevice";
    }
    return res;
}

void AudioCaptureDevice::close()
{
    LOG_DEBUG_N << "Closing AudioCaptureDevice. Pushed " << chunks_pushed_.load()
                << " chunks, dropped " << chunks_dropped_.load();

    // Whatever is left after the stream stopped
    pushChunk();
    QIODevice::close();
}

qint64 AudioCaptureDevice::writeData(const char *data, qint64 len)
{
    qint64 written = 0;

    // Fill the audio buffer and push to the ring buffer when full, or after 100 ms accumulated audio
    while (written < len) {
        const auto bytes_left = AUDIO_BUFFER_SIZE - audioBuffer_.size();
        const auto bytes_to_add = min<qint64>(bytes_left, len - written);

        audioBuffer_.append(data + written, bytes_to_add);
        written += bytes_to_add;

        const auto chunk_duration = chrono::steady_clock::now() - chunk_start_time_;
        if (chunk_duration >= 100ms || audioBuffer_.size() >= AUDIO_BUFFER_SIZE) {
            pushChunk();
        }
    }

    return len;
}

float AudioCaptureDevice::volumeOf(std::span<const qint16> samples) noexcept
{
    if (samples.empty()) {
        return 0.0f;
    }

    double sum = 0.0;
    for (const qint16 s : samples) {
        const auto v = static_cast<double>(s);
        sum += v * v;
    }

    const auto rms = std::sqrt(sum / static_cast<double>(samples.size())) / 32768.0;
    if (!std::isfinite(rms)) {
        return 0.0f;
    }

    return static_cast<float>(std::clamp(rms, 0.0, 1.0));
}

void AudioCaptureDevice::prepareBuffer()
{
    audioBuffer_.clear();
    audioBuffer_.reserve(AUDIO_BUFFER_SIZE);
}

void AudioCaptureDevice::pushChunk()
{
    // Only whole samples leave the device. An odd trailing byte waits for its pair.
    const auto usable = audioBuffer_.size() & ~qsizetype{1};
    if (usable == 0) {
        return;
    }

    QByteArray tail;
    if (usable < audioBuffer_.size()) {
        tail = audioBuffer_.sliced(usable);
        audioBuffer_.truncate(usable);
    }

    const auto volume = volumeOf(std::span<const qint16>(reinterpret_cast<const qint16*>(audioBuffer_.constData()),
                                                         static_cast<size_t>(usable) / sizeof(qint16)));

    if (!ring_->push(std::move(audioBuffer_))) {
        ++chunks_dropped_;
        LOG_WARN_N << "Ring buffer overflow. Dropped the oldest chunk (" << ring_->overflows() << " total)";
    }
    ++chunks_pushed_;

    chunk_start_time_ = chrono::steady_clock::now();
    prepareBuffer();
    if (!tail.isEmpty()) {
        audioBuffer_.append(tail);
    }

    publishVolume(volume);
}

void AudioCaptureDevice::publishVolume(float value)
{
    latest_volume_ = value;
    ++volume_seq_;

    // Coalesce: while one notification is queued, newer values just replace the payload
    if (!volume_pending_.exchange(true)) {
        QMetaObject::invokeMethod(this, [this] { deliverVolume(); }, Qt::QueuedConnection);
    }
}

void AudioCaptureDevice::deliverVolume()
{
    volume_pending_ = false;
    emit volumeChanged(VolumeSample{latest_volume_.load(), volume_seq_.load()});
}

#pragma once

#include <atomic>
#include <chrono>
#include <span>

#include <QIODevice>

#include "AudioRingBuffer.h"
#include "AudioTypes.h"

constexpr int AUDIO_BUFFER_SIZE = 1024 * 16;  // 16 KB, about half a second at 16 kHz

/*! Push-mode sink for QAudioSource.
 *
 *  writeData() runs on the audio thread. It slices the stream into chunks,
 *  hands them to the ring buffer without blocking, and publishes one volume
 *  value per chunk.
 */
class AudioCaptureDevice : public QIODevice
{
    Q_OBJECT
public:
    explicit AudioCaptureDevice(AudioRingBuffer *ring, QObject *parent = nullptr);

    bool open(OpenMode mode) override;

    void close() override;

    /*! Volume metric for a chunk.
     *
     *  Root mean square of the samples divided by 32768, clamped to [0, 1].
     *  0 for an empty chunk. Never NaN.
     */
    static float volumeOf(std::span<const qint16> samples) noexcept;

    quint64 chunksPushed() const noexcept { return chunks_pushed_; }
    quint64 chunksDropped() const noexcept { return chunks_dropped_; }

protected:
    qint64 readData(char *, qint64) override
    {
        return -1;
    }

    qint64 writeData(const char *data, qint64 len) override;

signals:
    void volumeChanged(VolumeSample sample);

private:
    void prepareBuffer();
    void pushChunk();
    void publishVolume(float value);
    void deliverVolume();

    AudioRingBuffer *ring_;
    QByteArray audioBuffer_;
    std::chrono::steady_clock::time_point chunk_start_time_;
    std::atomic<float> latest_volume_{0.0f};
    std::atomic<quint64> volume_seq_{0};
    std::atomic_bool volume_pending_{false};
    std::atomic<quint64> chunks_pushed_{0};
    std::atomic<quint64> chunks_dropped_{0};
};

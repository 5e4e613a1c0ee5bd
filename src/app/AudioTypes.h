#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <QByteArray>
#include <QMetaType>

constexpr int TARGET_SAMPLE_RATE = 16000;

enum class SampleRateMode {
    Native, // Whatever the device prefers
    Fixed   // TARGET_SAMPLE_RATE if the device accepts it
};

std::ostream& operator << (std::ostream& os, SampleRateMode mode);

/*! One contiguous recording interval.
 *
 *  Filled by the frame accumulator while recording. Once sealed by
 *  AudioRecorder::stop() it is handed off by unique ownership and the
 *  capture side never touches it again.
 */
struct CaptureSession {
    QByteArray deviceId;
    int nativeSampleRate{}; // 0 if unknown
    int channelCount{1};
    std::vector<QByteArray> frames; // Signed 16 bit little endian PCM
    bool isActive{false};

    bool empty() const noexcept {
        for (const auto& f : frames) {
            if (!f.isEmpty()) {
                return false;
            }
        }
        return true;
    }

    size_t numSamples() const noexcept {
        size_t bytes = 0;
        for (const auto& f : frames) {
            bytes += static_cast<size_t>(f.size());
        }
        return bytes / sizeof(qint16);
    }
};

struct VolumeSample {
    float value{};   // 0..1
    quint64 seq{};
};

struct NormalizedAudio {
    std::vector<float> samples; // -1..1
    int sampleRate{TARGET_SAMPLE_RATE};

    double durationSeconds() const noexcept {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }
};

struct TranscriptionRequest {
    NormalizedAudio audio;
    std::string languageHint; // empty for auto-detect
    std::string modelName;
};

Q_DECLARE_METATYPE(VolumeSample)

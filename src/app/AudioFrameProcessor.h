#pragma once

#include <functional>
#include <span>
#include <vector>

#include <QByteArray>

#include "AudioTypes.h"

/*! Turns a sealed capture session into the signal the transcriber wants.
 *
 *  Concatenates the raw chunks, resamples to TARGET_SAMPLE_RATE and
 *  normalizes to [-1, 1]. Stateless and safe to call from any thread.
 */
class AudioFrameProcessor
{
public:
    // Returns the device's default rate, or 0 if unknown
    using rate_query_t = std::function<int(const QByteArray& deviceId)>;

    static constexpr int fallback_sample_rate = 44100;

    static NormalizedAudio process(const CaptureSession& session,
                                   const rate_query_t& defaultRate = {});

    static std::vector<qint16> concatenate(const CaptureSession& session);

    /*! The rate the session was recorded at.
     *
     *  The session's own rate if known, else the device default (with a
     *  warning), else fallback_sample_rate.
     */
    static int resolveSampleRate(const CaptureSession& session, const rate_query_t& defaultRate);

    static size_t resampledLength(size_t inputLength, int fromRate, int toRate) noexcept;

    /*! Band-limited resampling with a Blackman windowed sinc kernel.
     *
     *  The cutoff is the lower of the two Nyquist frequencies. Returns the
     *  input unchanged if the rates are equal.
     */
    static std::vector<float> resample(std::span<const float> input, int fromRate, int toRate);
};

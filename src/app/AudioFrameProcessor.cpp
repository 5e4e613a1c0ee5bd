#include <algorithm>
#include <cmath>
#include <cstring>
#include <numbers>

#include "AudioFrameProcessor.h"
#include "ScopedTimer.h"

#include "logging.h"

using namespace std;

namespace {

// Zero crossings of the sinc on each side, at the cutoff frequency
constexpr int zero_crossings = 16;

double sinc(double x) noexcept {
    if (std::abs(x) < 1e-9) {
        return 1.0;
    }
    const auto px = std::numbers::pi * x;
    return std::sin(px) / px;
}

// Blackman window over [-halfWidth, halfWidth]
double blackman(double x, double halfWidth) noexcept {
    if (std::abs(x) >= halfWidth) {
        return 0.0;
    }
    const auto r = std::numbers::pi * x / halfWidth;
    return 0.42 + 0.5 * std::cos(r) + 0.08 * std::cos(2.0 * r);
}

} // anon ns

vector<qint16> AudioFrameProcessor::concatenate(const CaptureSession &session)
{
    vector<qint16> pcm(session.numSamples());

    auto *dst = reinterpret_cast<char *>(pcm.data());
    const auto capacity = pcm.size() * sizeof(qint16);
    size_t offset = 0;
    for (const auto& frame : session.frames) {
        const auto bytes = std::min<size_t>(static_cast<size_t>(frame.size()), capacity - offset);
        if (bytes) {
            memcpy(dst + offset, frame.constData(), bytes);
            offset += bytes;
        }
    }

    return pcm;
}

int AudioFrameProcessor::resolveSampleRate(const CaptureSession &session, const rate_query_t &defaultRate)
{
    if (session.nativeSampleRate > 0) {
        return session.nativeSampleRate;
    }

    if (defaultRate) {
        if (const auto rate = defaultRate(session.deviceId); rate > 0) {
            LOG_WARN_N << "Capture session has no sample rate. Assuming the device default " << rate << " Hz";
            return rate;
        }
    }

    LOG_WARN_N << "Capture session has no sample rate and the device default is unknown. Assuming "
               << fallback_sample_rate << " Hz";
    return fallback_sample_rate;
}

size_t AudioFrameProcessor::resampledLength(size_t inputLength, int fromRate, int toRate) noexcept
{
    if (fromRate <= 0 || toRate <= 0 || fromRate == toRate) {
        return inputLength;
    }
    return static_cast<size_t>(std::llround(static_cast<double>(inputLength) * toRate / fromRate));
}

vector<float> AudioFrameProcessor::resample(std::span<const float> input, int fromRate, int toRate)
{
    if (fromRate == toRate || fromRate <= 0 || toRate <= 0 || input.empty()) {
        return {input.begin(), input.end()};
    }

    const double ratio = static_cast<double>(toRate) / fromRate;
    const double cutoff = std::min(1.0, ratio); // relative to the input Nyquist
    const double half_width = zero_crossings / cutoff; // in input samples
    const auto taps = static_cast<long long>(std::ceil(half_width));
    const auto n_in = static_cast<long long>(input.size());

    vector<float> out(resampledLength(input.size(), fromRate, toRate));

    for (size_t j = 0; j < out.size(); ++j) {
        const double t = static_cast<double>(j) / ratio; // position in the input
        const auto center = static_cast<long long>(std::floor(t));
        const auto first = std::max(0LL, center - taps + 1);
        const auto last = std::min(n_in - 1, center + taps);

        double acc = 0.0;
        double weight = 0.0;
        for (auto i = first; i <= last; ++i) {
            const double x = t - static_cast<double>(i);
            const double h = cutoff * sinc(cutoff * x) * blackman(x, half_width);
            acc += h * input[static_cast<size_t>(i)];
            weight += h;
        }

        // Unity gain at DC, also near the edges where the kernel is truncated
        out[j] = static_cast<float>(std::abs(weight) > 1e-9 ? acc / weight : acc);
    }

    return out;
}

NormalizedAudio AudioFrameProcessor::process(const CaptureSession &session, const rate_query_t &defaultRate)
{
    ScopedTimer timer;
    NormalizedAudio result;
    result.sampleRate = TARGET_SAMPLE_RATE;

    const auto pcm = concatenate(session);
    if (pcm.empty()) {
        LOG_DEBUG_N << "Nothing to process";
        return result;
    }

    const auto rate = resolveSampleRate(session, defaultRate);

    vector<float> signal(pcm.size());
    std::transform(pcm.begin(), pcm.end(), signal.begin(), [](qint16 s) {
        return static_cast<float>(s) / 32768.0f;
    });

    if (rate != TARGET_SAMPLE_RATE) {
        LOG_DEBUG_N << "Resampling " << pcm.size() << " samples from " << rate << " Hz to " << TARGET_SAMPLE_RATE << " Hz";
        result.samples = resample(signal, rate, TARGET_SAMPLE_RATE);
    } else {
        result.samples = std::move(signal);
    }

    for (auto& s : result.samples) {
        s = std::clamp(s, -1.0f, 1.0f);
    }

    LOG_DEBUG_N << "Processed " << pcm.size() << " samples into " << result.samples.size()
                << " (" << result.durationSeconds() << " s) in " << timer.elapsedMs() << " ms";
    return result;
}

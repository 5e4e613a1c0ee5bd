#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

#include <gtest/gtest.h>

#include "AudioFrameProcessor.h"
#include "test_utils.hpp"

using namespace std;
using namespace qdt_test;

namespace {

CaptureSession makeSession(const vector<qint16>& pcm, int rate, size_t chunkSamples = 1600) {
    CaptureSession s;
    s.deviceId = "test";
    s.nativeSampleRate = rate;
    for (size_t pos = 0; pos < pcm.size(); pos += chunkSamples) {
        const auto end = min(pcm.size(), pos + chunkSamples);
        s.frames.push_back(toBytes(vector<qint16>(pcm.begin() + static_cast<ptrdiff_t>(pos),
                                                  pcm.begin() + static_cast<ptrdiff_t>(end))));
    }
    return s;
}

// RMS over the middle half, away from the edges
double middleRms(const vector<float>& v) {
    const auto first = v.size() / 4;
    const auto last = v.size() - v.size() / 4;
    double sum = 0.0;
    for (auto i = first; i < last; ++i) {
        sum += static_cast<double>(v[i]) * v[i];
    }
    return std::sqrt(sum / static_cast<double>(last - first));
}

vector<float> toFloat(const vector<qint16>& pcm) {
    vector<float> out(pcm.size());
    transform(pcm.begin(), pcm.end(), out.begin(), [](qint16 s) { return s / 32768.0f; });
    return out;
}

} // anon ns

TEST(AudioFrameProcessor, ConcatenatesInOrder) {
    vector<qint16> pcm(5000);
    iota(pcm.begin(), pcm.end(), qint16{-2500});

    const auto session = makeSession(pcm, 16000, 333);
    EXPECT_GT(session.frames.size(), 10u);
    EXPECT_EQ(AudioFrameProcessor::concatenate(session), pcm);
}

TEST(AudioFrameProcessor, ConcatenateSkipsEmptyFrames) {
    CaptureSession s;
    s.frames.push_back({});
    s.frames.push_back(toBytes({1, 2}));
    s.frames.push_back({});
    s.frames.push_back(toBytes({3}));

    EXPECT_EQ(AudioFrameProcessor::concatenate(s), (vector<qint16>{1, 2, 3}));
}

TEST(AudioFrameProcessor, ResolvesSampleRate) {
    CaptureSession s;
    s.deviceId = "mic";
    s.nativeSampleRate = 22050;

    int queries = 0;
    const AudioFrameProcessor::rate_query_t query = [&](const QByteArray& id) {
        ++queries;
        EXPECT_EQ(id, "mic");
        return 48000;
    };

    EXPECT_EQ(AudioFrameProcessor::resolveSampleRate(s, query), 22050);
    EXPECT_EQ(queries, 0);

    s.nativeSampleRate = 0;
    EXPECT_EQ(AudioFrameProcessor::resolveSampleRate(s, query), 48000);
    EXPECT_EQ(queries, 1);

    EXPECT_EQ(AudioFrameProcessor::resolveSampleRate(s, [](const QByteArray&) { return 0; }),
              AudioFrameProcessor::fallback_sample_rate);
    EXPECT_EQ(AudioFrameProcessor::resolveSampleRate(s, {}), 44100);
}

TEST(AudioFrameProcessor, ResampledLength) {
    EXPECT_EQ(AudioFrameProcessor::resampledLength(48000, 48000, 16000), 16000u);
    EXPECT_EQ(AudioFrameProcessor::resampledLength(44100, 44100, 16000), 16000u);
    EXPECT_EQ(AudioFrameProcessor::resampledLength(8000, 8000, 16000), 16000u);
    EXPECT_EQ(AudioFrameProcessor::resampledLength(1000, 16000, 16000), 1000u);

    // round(441 * 16000 / 44100) = round(160)
    EXPECT_EQ(AudioFrameProcessor::resampledLength(441, 44100, 16000), 160u);
    // round(3 * 16000 / 44100) = round(1.088)
    EXPECT_EQ(AudioFrameProcessor::resampledLength(3, 44100, 16000), 1u);
    EXPECT_EQ(AudioFrameProcessor::resampledLength(0, 44100, 16000), 0u);
}

TEST(AudioFrameProcessor, PassesTargetRateThrough) {
    const vector<qint16> pcm{0, 16384, -16384, 32767, -32768};
    const auto out = AudioFrameProcessor::process(makeSession(pcm, TARGET_SAMPLE_RATE));

    EXPECT_EQ(out.sampleRate, TARGET_SAMPLE_RATE);
    ASSERT_EQ(out.samples.size(), pcm.size());
    EXPECT_FLOAT_EQ(out.samples[0], 0.0f);
    EXPECT_FLOAT_EQ(out.samples[1], 0.5f);
    EXPECT_FLOAT_EQ(out.samples[2], -0.5f);
    EXPECT_NEAR(out.samples[3], 1.0f, 1e-4);
    EXPECT_FLOAT_EQ(out.samples[4], -1.0f);
}

TEST(AudioFrameProcessor, EmptySessionGivesEmptySignal) {
    CaptureSession s;
    s.nativeSampleRate = 48000;
    const auto out = AudioFrameProcessor::process(s);
    EXPECT_TRUE(out.samples.empty());
    EXPECT_EQ(out.sampleRate, TARGET_SAMPLE_RATE);
    EXPECT_EQ(out.durationSeconds(), 0.0);
}

TEST(AudioFrameProcessor, DownsamplesAndKeepsDuration) {
    const auto pcm = sine(48000, 440.0, 2.0, 0.5);
    const auto out = AudioFrameProcessor::process(makeSession(pcm, 48000));

    EXPECT_EQ(out.samples.size(), 32000u);
    EXPECT_NEAR(out.durationSeconds(), 2.0, 1e-9);

    // A tone well below the new Nyquist keeps its level
    EXPECT_NEAR(middleRms(out.samples), 0.5 / std::sqrt(2.0), 0.01);
}

TEST(AudioFrameProcessor, UsesDeviceRateWhenSessionRateIsUnknown) {
    const auto pcm = sine(48000, 440.0, 1.0);
    auto session = makeSession(pcm, 0);

    const auto out = AudioFrameProcessor::process(session, [](const QByteArray&) { return 48000; });
    EXPECT_EQ(out.samples.size(), 16000u);

    // 44100 when nobody knows
    const auto fallback = AudioFrameProcessor::process(session);
    EXPECT_EQ(fallback.samples.size(), AudioFrameProcessor::resampledLength(pcm.size(), 44100, 16000));
}

TEST(AudioFrameProcessor, RemovesContentAboveTheNewNyquist) {
    // 12 kHz cannot be represented at 16 kHz and must not alias down to 4 kHz
    const auto input = toFloat(sine(48000, 12000.0, 1.0, 0.5));
    const auto out = AudioFrameProcessor::resample(input, 48000, 16000);

    ASSERT_EQ(out.size(), 16000u);
    EXPECT_LT(middleRms(out), 0.01);
}

TEST(AudioFrameProcessor, KeepsUnityGainAtDc) {
    const vector<float> dc(44100, 0.25f);
    const auto out = AudioFrameProcessor::resample(dc, 44100, 16000);

    ASSERT_EQ(out.size(), 16000u);
    for (const auto v : out) {
        EXPECT_NEAR(v, 0.25f, 1e-4);
    }
}

TEST(AudioFrameProcessor, Upsamples) {
    const auto input = toFloat(sine(8000, 300.0, 1.0, 0.5));
    const auto out = AudioFrameProcessor::resample(input, 8000, 16000);

    ASSERT_EQ(out.size(), 16000u);
    EXPECT_NEAR(middleRms(out), 0.5 / std::sqrt(2.0), 0.01);

    // Every other output sample lands on an input sample
    for (size_t i = 4000; i < 4100; i += 2) {
        EXPECT_NEAR(out[i], input[i / 2], 1e-3);
    }
}

TEST(AudioFrameProcessor, OutputIsClamped) {
    // A full scale square wave overshoots when band limited
    vector<qint16> pcm(48000);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = ((i / 24) % 2) ? qint16{32767} : qint16{-32768};
    }

    const auto out = AudioFrameProcessor::process(makeSession(pcm, 48000));
    ASSERT_EQ(out.samples.size(), 16000u);
    for (const auto v : out.samples) {
        ASSERT_GE(v, -1.0f);
        ASSERT_LE(v, 1.0f);
    }
}

#include <QSettings>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "AppConfig.h"

using namespace std;

TEST(AppConfig, Defaults) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QSettings settings{tmp.filePath("empty.ini"), QSettings::IniFormat};

    const auto cfg = AppConfig::load(settings);
    EXPECT_TRUE(cfg.deviceId.isEmpty());
    EXPECT_EQ(cfg.sampleRateMode, SampleRateMode::Fixed);
    EXPECT_EQ(cfg.modelName, "base");
    EXPECT_EQ(cfg.language, "");
    EXPECT_TRUE(cfg.modelsPath.empty());
    EXPECT_EQ(cfg.threads, -1);
    EXPECT_TRUE(cfg.preloadModel);
    EXPECT_FALSE(cfg.useGpu);
    EXPECT_TRUE(cfg.lockPath.isEmpty());
}

TEST(AppConfig, ReadsSettings) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QSettings settings{tmp.filePath("qdictate.ini"), QSettings::IniFormat};
    settings.setValue("audio/device", "alsa_input.usb");
    settings.setValue("audio/sample_rate_mode", "native");
    settings.setValue("transcribe/model", "small.en");
    settings.setValue("transcribe/language", "NO");
    settings.setValue("models/path", "/data/models");
    settings.setValue("transcribe/threads", 6);
    settings.setValue("transcribe/preload", false);
    settings.setValue("engine/use_gpu", true);
    settings.setValue("lock/path", "/run/user/1000/qdictate.lock");

    const auto cfg = AppConfig::load(settings);
    EXPECT_EQ(cfg.deviceId, "alsa_input.usb");
    EXPECT_EQ(cfg.sampleRateMode, SampleRateMode::Native);
    EXPECT_EQ(cfg.modelName, "small.en");
    EXPECT_EQ(cfg.language, "no");
    EXPECT_EQ(cfg.modelsPath, "/data/models");
    EXPECT_EQ(cfg.threads, 6);
    EXPECT_FALSE(cfg.preloadModel);
    EXPECT_TRUE(cfg.useGpu);
    EXPECT_EQ(cfg.lockPath, "/run/user/1000/qdictate.lock");
}

TEST(AppConfig, MalformedValuesFallBack) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    QSettings settings{tmp.filePath("bad.ini"), QSettings::IniFormat};
    settings.setValue("audio/sample_rate_mode", "turbo");
    settings.setValue("transcribe/model", "   ");
    settings.setValue("transcribe/threads", "many");

    const auto cfg = AppConfig::load(settings);
    EXPECT_EQ(cfg.sampleRateMode, SampleRateMode::Fixed);
    EXPECT_EQ(cfg.modelName, "base");
    EXPECT_EQ(cfg.threads, -1);
}

TEST(AppConfig, NormalizesLanguage) {
    EXPECT_EQ(AppConfig::normalizeLanguage("auto"), "");
    EXPECT_EQ(AppConfig::normalizeLanguage(" Auto "), "");
    EXPECT_EQ(AppConfig::normalizeLanguage("none"), "");
    EXPECT_EQ(AppConfig::normalizeLanguage(""), "");
    EXPECT_EQ(AppConfig::normalizeLanguage("EN"), "en");
}

TEST(AppConfig, ParsesSampleRateMode) {
    bool ok = false;
    EXPECT_EQ(AppConfig::parseSampleRateMode("native", &ok), SampleRateMode::Native);
    EXPECT_TRUE(ok);
    EXPECT_EQ(AppConfig::parseSampleRateMode("Device", &ok), SampleRateMode::Native);
    EXPECT_TRUE(ok);
    EXPECT_EQ(AppConfig::parseSampleRateMode("fixed", &ok), SampleRateMode::Fixed);
    EXPECT_TRUE(ok);
    EXPECT_EQ(AppConfig::parseSampleRateMode("whisper", &ok), SampleRateMode::Fixed);
    EXPECT_TRUE(ok);
    EXPECT_EQ(AppConfig::parseSampleRateMode("44100", &ok), SampleRateMode::Fixed);
    EXPECT_FALSE(ok);
}

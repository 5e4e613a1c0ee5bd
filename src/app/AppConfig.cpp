#include <array>
#include <string_view>

#include <QSettings>

#include "AppConfig.h"
#include "logging.h"

using namespace std;

ostream& operator << (ostream& os, SampleRateMode mode) {
    constexpr auto modes = to_array<string_view>({
        "native",
        "fixed"
    });

    return os << modes.at(static_cast<size_t>(mode));
}

string AppConfig::normalizeLanguage(const QString &lang)
{
    const auto l = lang.trimmed().toLower();
    if (l.isEmpty() || l == "auto" || l == "none") {
        return {};
    }
    return l.toStdString();
}

SampleRateMode AppConfig::parseSampleRateMode(const QString &value, bool *ok)
{
    const auto v = value.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (v == "native" || v == "device") {
        return SampleRateMode::Native;
    }
    if (v == "fixed" || v == "whisper" || v.isEmpty()) {
        return SampleRateMode::Fixed;
    }

    if (ok) {
        *ok = false;
    }
    return SampleRateMode::Fixed;
}

AppConfig AppConfig::load(QSettings &settings)
{
    AppConfig cfg;

    cfg.deviceId = settings.value("audio/device", QString{}).toString().toUtf8();

    bool ok = false;
    const auto mode = settings.value("audio/sample_rate_mode", "fixed").toString();
    cfg.sampleRateMode = parseSampleRateMode(mode, &ok);
    if (!ok) {
        LOG_WARN_N << "Unknown audio/sample_rate_mode '" << mode.toStdString() << "', using " << cfg.sampleRateMode;
    }

    if (const auto model = settings.value("transcribe/model", "base").toString().trimmed(); !model.isEmpty()) {
        cfg.modelName = model.toStdString();
    } else {
        LOG_WARN_N << "Empty transcribe/model, using " << cfg.modelName;
    }

    cfg.language = normalizeLanguage(settings.value("transcribe/language", "auto").toString());
    cfg.modelsPath = settings.value("models/path", QString{}).toString().toStdString();

    const auto threads = settings.value("transcribe/threads", -1).toInt(&ok);
    if (ok && threads != 0) {
        cfg.threads = threads;
    } else if (!ok) {
        LOG_WARN_N << "Malformed transcribe/threads, using the engine default";
    }

    cfg.preloadModel = settings.value("transcribe/preload", true).toBool();
    cfg.useGpu = settings.value("engine/use_gpu", false).toBool();
    cfg.lockPath = settings.value("lock/path", QString{}).toString();

    LOG_DEBUG_N << "Configuration: device='" << cfg.deviceId.toStdString()
                << "' rate_mode=" << cfg.sampleRateMode
                << " model=" << cfg.modelName
                << " language=" << (cfg.language.empty() ? "auto" : cfg.language)
                << " preload=" << cfg.preloadModel;

    return cfg;
}

AppConfig AppConfig::load()
{
    QSettings settings;
    return load(settings);
}

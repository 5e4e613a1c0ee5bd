#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <QByteArray>
#include <QString>

#include "AudioTypes.h"

class QSettings;

/*! Immutable snapshot of the settings the pipeline needs.
 *
 *  Read once from QSettings at start-up. Command-line options are applied on
 *  top of it by the caller, and AppEngine::applyConfig() takes a new snapshot
 *  as a whole.
 */
struct AppConfig {
    QByteArray deviceId; // empty for the system default
    SampleRateMode sampleRateMode{SampleRateMode::Fixed};
    std::string modelName{"base"};
    std::string language; // empty for auto-detect
    std::filesystem::path modelsPath;
    int threads{-1};
    bool preloadModel{true};
    bool useGpu{false};
    QString lockPath;
    std::chrono::milliseconds cleanupDelay{1000};
    std::chrono::milliseconds shutdownTimeout{5000};

    static AppConfig load(QSettings& settings);
    static AppConfig load();

    // "auto", "" and "none" all mean auto-detect
    static std::string normalizeLanguage(const QString& lang);
    static SampleRateMode parseSampleRateMode(const QString& value, bool *ok = nullptr);
};


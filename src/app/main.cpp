#include <memory>
#include <iostream>

#include <unistd.h>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QSocketNotifier>
#include <QTextStream>

#include "logging.h"

#include "qdt/WhisperEngine.h"

#include "AppConfig.h"
#include "AppEngine.h"
#include "AudioController.h"
#include "InstanceLock.h"
#include "ModelLocator.h"

using namespace std;

namespace {

void listDevices(const AudioController& audio) {
    QTextStream out{stdout};
    for (const auto& dev : audio.inputDevices()) {
        out << dev.id() << '\t' << dev.description() << '\t'
            << audio.defaultSampleRate(dev.id()) << " Hz\n";
    }
}

void listModels(const AppConfig& config) {
    ModelSearchConfig cfg;
    if (!config.modelsPath.empty()) {
        cfg.extra_search_paths.push_back(config.modelsPath);
    }

    QTextStream out{stdout};
    for (const auto& name : ModelLocator{std::move(cfg)}.available_models()) {
        out << QString::fromStdString(name) << '\n';
    }
}

void handleCommand(AppEngine& engine, const QString& line) {
    const auto cmd = line.trimmed().toLower();
    if (cmd.isEmpty()) {
        return;
    }

    if (cmd == "start") {
        engine.startRecording();
    } else if (cmd == "stop") {
        engine.stopRecording();
    } else if (cmd == "toggle") {
        engine.toggleRecording();
    } else if (cmd == "cancel") {
        engine.cancelTranscription();
    } else if (cmd == "quit" || cmd == "exit") {
        QCoreApplication::quit();
    } else {
        QTextStream{stderr} << "Unknown command: " << cmd
                            << ". Use start, stop, toggle, cancel or quit.\n";
    }
}

int run(QCoreApplication& app, const AppConfig& config)
{
    AudioController audio;

    auto whisper = qdt::WhisperEngine::create({});
    if (!whisper) {
        LOG_ERROR << "Failed to create the Whisper engine";
        return 1;
    }

    whisper->setLogger(qdt::logfwd::forward_to_logfault,
                       static_cast<qdt::logfwd::Level>(
                           ::logfault::LogManager::Instance().GetLoglevel()));
    if (!whisper->init()) {
        LOG_ERROR << "Failed to initialize " << whisper->version() << ": " << whisper->lastError();
        return 1;
    }
    LOG_INFO << "Using " << whisper->version();

    auto load_params = make_shared<qdt::WhisperEngineLoadParams>();
    load_params->use_gpu = config.useGpu;

    QTextStream out{stdout};
    AppEngine engine{config, audio, whisper, load_params};

    QObject::connect(&engine, &AppEngine::stateChanged, &app, [&out](AppEngine::State state) {
        switch(state) {
        case AppEngine::State::Idle:
            out << "[idle]" << Qt::endl;
            break;
        case AppEngine::State::Recording:
            out << "[recording]" << Qt::endl;
            break;
        case AppEngine::State::Processing:
            out << "[processing]" << Qt::endl;
            break;
        }
    });
    QObject::connect(&engine, &AppEngine::transcriptionProgress, &app, [&out](const QString& text) {
        out << "... " << text << Qt::endl;
    });
    QObject::connect(&engine, &AppEngine::transcriptionCompleted, &app, [&out](const QString& text) {
        out << text << Qt::endl;
    });
    QObject::connect(&engine, &AppEngine::transcriptionFailed, &app, [&out](const QString& reason) {
        out << "[failed] " << reason << Qt::endl;
    });
    QObject::connect(&engine, &AppEngine::captureFailed, &app, [&out](const QString& reason) {
        out << "[capture failed] " << reason << Qt::endl;
    });

    QSocketNotifier stdin_notifier{STDIN_FILENO, QSocketNotifier::Read};
    QTextStream in{stdin};
    QObject::connect(&stdin_notifier, &QSocketNotifier::activated, &app, [&] {
        const auto line = in.readLine();
        if (line.isNull()) {
            LOG_INFO << "End of input";
            stdin_notifier.setEnabled(false);
            QCoreApplication::quit();
            return;
        }
        handleCommand(engine, line);
    });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&] {
        if (!engine.shutdown(config.shutdownTimeout)) {
            LOG_WARN << "The transcription worker did not stop in time";
        }
    });

    engine.preloadModel();
    out << "Commands: start, stop, toggle, cancel, quit" << Qt::endl;

    return app.exec();
}

} // anon ns

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setOrganizationName("QDictate");
    QCoreApplication::setApplicationName("QDictate");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QSettings settings;

    AppEngine::initLogging();

    LOG_INFO << "Starting QDictate " << APP_VERSION;
    LOG_INFO << "Configuration from '" << settings.fileName().toStdString() << "'";

    QCommandLineParser parser;
    parser.setApplicationDescription("Records speech from the microphone and prints the transcript.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption device_opt{{"d", "device"}, "Audio input device id.", "id"};
    const QCommandLineOption model_opt{{"m", "model"}, "Whisper model name, for example base or small.en.", "name"};
    const QCommandLineOption language_opt{{"l", "language"}, "Language code, or auto.", "code"};
    const QCommandLineOption models_path_opt{"models-path", "Extra directory to search for models.", "path"};
    const QCommandLineOption rate_mode_opt{"sample-rate-mode", "native or fixed.", "mode"};
    const QCommandLineOption threads_opt{{"t", "threads"}, "Number of inference threads.", "count"};
    const QCommandLineOption list_devices_opt{"list-devices", "List audio input devices and exit."};
    const QCommandLineOption list_models_opt{"list-models", "List the models found on disk and exit."};

    parser.addOptions({device_opt, model_opt, language_opt, models_path_opt, rate_mode_opt,
                       threads_opt, list_devices_opt, list_models_opt});
    parser.process(app);

    auto config = AppConfig::load(settings);
    if (parser.isSet(device_opt)) {
        config.deviceId = parser.value(device_opt).toUtf8();
    }
    if (parser.isSet(model_opt)) {
        config.modelName = parser.value(model_opt).toStdString();
    }
    if (parser.isSet(language_opt)) {
        config.language = AppConfig::normalizeLanguage(parser.value(language_opt));
    }
    if (parser.isSet(models_path_opt)) {
        config.modelsPath = parser.value(models_path_opt).toStdString();
    }
    if (parser.isSet(rate_mode_opt)) {
        bool ok = false;
        config.sampleRateMode = AppConfig::parseSampleRateMode(parser.value(rate_mode_opt), &ok);
        if (!ok) {
            LOG_WARN << "Unknown sample rate mode '" << parser.value(rate_mode_opt).toStdString()
                     << "'. Using " << config.sampleRateMode;
        }
    }
    if (parser.isSet(threads_opt)) {
        bool ok = false;
        if (const auto threads = parser.value(threads_opt).toInt(&ok); ok) {
            config.threads = threads;
        } else {
            LOG_WARN << "Ignoring invalid thread count '" << parser.value(threads_opt).toStdString() << "'";
        }
    }

    if (parser.isSet(list_models_opt)) {
        listModels(config);
        return 0;
    }

    if (parser.isSet(list_devices_opt)) {
        listDevices(AudioController{});
        return 0;
    }

    // Nothing touches the audio system before we know we are alone
    InstanceLock lock{config.lockPath.isEmpty() ? InstanceLock::defaultPath() : config.lockPath};
    if (const auto rval = lock.runExclusive([&] { return run(app, config); })) {
        return *rval;
    }

    cerr << "QDictate is already running, or the lock at "
         << lock.path().toStdString() << " could not be taken." << endl;
    return 1;
}

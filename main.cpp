#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDebug>
#include <QDir>
#include "ConfigLoader.h"
#include "PlayerConfig.h"
#include "pianoplayer/backend/BackendFactory.h"
#include "pianoplayer/engine/PlaybackController.h"
#include "pianoplayer/input/X11HotkeyListener.h"
#include "pianoplayer/score/MusicXmlScoreSource.h"
#include "pianoplayer/score/ScoreLibrary.h"

using namespace pianoplayer;

static void printBanner(const PlayerConfig& config, const backend::OutputBackend& out, int scoreCount) {
    qInfo().noquote() << "==============================================";
    qInfo().noquote() << " Piano Player";
    qInfo().noquote() << "==============================================";
    qInfo().noquote() << QString(" Mode:       %1").arg(score::selectionModeName(config.mode));
    qInfo().noquote() << QString(" Backend:    %1 %2").arg(out.name(), out.supportedRange().toString());
    qInfo().noquote() << QString(" Tolerance:  %1 semitone(s)").arg(config.tolerance);
    qInfo().noquote() << QString(" Scores:     %1 in %2").arg(scoreCount).arg(QDir(config.scoresDirectory).absolutePath());
    qInfo().noquote() << "----------------------------------------------";
    for (const auto& b : input::defaultHotkeyBindings()) {
        qInfo().noquote() << QString(" %1  %2").arg(b.keyName, -7).arg(engine::controlEventName(b.event));
    }
    qInfo().noquote() << "==============================================";
}

int main(int argc, char *argv[]) {
    // Key injection and the hotkey listener talk to X from different threads.
    input::initX11Threads();

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pianoplayer");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Plays MusicXML scores through simulated keys, piano samples or MIDI, driven by global hotkeys.");
    parser.addHelpOption();
    parser.addVersionOption();
    ConfigLoader::addCommandLineOptions(parser);
    parser.process(app);

    // The ":/" prefix reads the defaults embedded from resources.qrc.
    const QString configPath = parser.isSet("config") ? parser.value("config") : QString(":/pianoplayer.xml");

    ConfigLoader loader;
    PlayerConfig config = loader.loadConfig(configPath);
    if (!config.isValid) {
        qCritical().noquote() << "Could not load or parse the config" << configPath << "- the player cannot start.";
        return 1;
    }
    ConfigLoader::applyCommandLine(parser, config);

    QLoggingCategory::setFilterRules(config.verbose ? "*.debug=true" : "*.debug=false");

    score::ScoreLibrary library(config.mode);
    library.setScores(score::ScoreLibrary::scan(config.scoresDirectory));

    QString backendError;
    std::unique_ptr<backend::OutputBackend> output =
        backend::openBackendWithFallback(config.backend, config.backendSettings, &backendError);
    if (!output) {
        qCritical().noquote() << "No output backend available:" << backendError;
        return 1;
    }

    score::MusicXmlScoreSource source;

    engine::ControllerSettings settings;
    settings.tolerance = config.tolerance;
    settings.autoAdvanceDelayMs = config.autoAdvanceDelayMs;
    settings.sequencer.staccatoFraction = config.staccatoFraction;
    settings.sequencer.velocities = config.velocities;

    engine::PlaybackController controller(&library, &source, output.get(), settings);
    QObject::connect(&controller, &engine::PlaybackController::statusMessage,
                     [](const QString& message) { qInfo().noquote() << message; });
    QObject::connect(&controller, &engine::PlaybackController::quitRequested,
                     &app, &QCoreApplication::quit, Qt::QueuedConnection);

    input::X11HotkeyListener hotkeys;
    QObject::connect(&hotkeys, &input::HotkeySource::controlEvent,
                     &controller, &engine::PlaybackController::handleControlEvent, Qt::QueuedConnection);

    QString hotkeyError;
    if (!hotkeys.start(&hotkeyError)) {
        qCritical().noquote() << "Global hotkeys unavailable:" << hotkeyError;
        return 1;
    }

    printBanner(config, *output, library.size());

    const int rc = app.exec();
    hotkeys.stop();
    return rc;
}

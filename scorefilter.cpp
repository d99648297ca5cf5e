#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include "pianoplayer/backend/KeySimulationBackend.h"
#include "pianoplayer/backend/SampleBackend.h"
#include "pianoplayer/engine/RangeAnalyzer.h"
#include "pianoplayer/score/MusicXmlScoreSource.h"
#include "pianoplayer/score/ScoreLibrary.h"

using namespace pianoplayer;

// Reports, for every score in a directory, how the player would treat it on a
// given backend, and optionally copies the playable ones elsewhere.

static score::PitchRange rangeForBackend(backend::BackendKind kind) {
    switch (kind) {
    case backend::BackendKind::KeySimulation:
        return {backend::KeySimulationBackend::kLowestPitch, backend::KeySimulationBackend::kHighestPitch};
    case backend::BackendKind::Sample:
        return {backend::SampleBackend::kLowestPitch, backend::SampleBackend::kHighestPitch};
    case backend::BackendKind::Midi:
        return {0, 127};
    }
    return {};
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pianoplayer-filter");

    QCommandLineParser parser;
    parser.setApplicationDescription("Checks which scores fit a backend's pitch range.");
    parser.addHelpOption();
    parser.addPositionalArgument("source", "Directory with .musicxml scores.");
    parser.addOptions({
        {"backend", "Range to check against: keys, sample or midi (default keys).", "backend", "keys"},
        {"tolerance", "Semitones the full score may exceed the range (default 0).", "semitones", "0"},
        {"dest", "Copy playable scores into <dir>.", "dir"},
        {"full-only", "Only accept scores that play in full (no melody fallback)."},
    });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(2);
    }

    backend::BackendKind kind = backend::BackendKind::KeySimulation;
    if (!backend::parseBackendKind(parser.value("backend"), kind)) {
        err << "Unknown backend: " << parser.value("backend") << Qt::endl;
        return 2;
    }
    bool ok = false;
    const int tolerance = parser.value("tolerance").toInt(&ok);
    if (!ok || tolerance < 0) {
        err << "Invalid tolerance: " << parser.value("tolerance") << Qt::endl;
        return 2;
    }

    const QString sourceDir = args.first();
    if (!QDir(sourceDir).exists()) {
        err << "Source directory not found: " << sourceDir << Qt::endl;
        return 1;
    }

    const QString destDir = parser.value("dest");
    if (!destDir.isEmpty() && !QDir().mkpath(destDir)) {
        err << "Could not create destination directory: " << destDir << Qt::endl;
        return 1;
    }
    const bool fullOnly = parser.isSet("full-only");

    const score::PitchRange target = rangeForBackend(kind);
    const engine::RangeAnalyzer analyzer(tolerance);
    score::MusicXmlScoreSource source;

    out << "Checking scores in " << QDir(sourceDir).absolutePath() << Qt::endl;
    out << "Backend range " << target.toString() << ", tolerance " << tolerance
        << " -> " << target.widened(tolerance).toString() << Qt::endl;

    int accepted = 0, skipped = 0, errors = 0;
    for (const QString& path : score::ScoreLibrary::scan(sourceDir)) {
        const QString fileName = QFileInfo(path).fileName();

        score::Score s;
        engine::PlaybackError error;
        if (!source.load(path, s, &error)) {
            out << fileName << ": " << engine::errorKindName(error.kind) << " (" << error.message << ")" << Qt::endl;
            ++errors;
            continue;
        }
        if (s.noteCount() == 0) {
            out << fileName << ": skipped (no notes)" << Qt::endl;
            ++skipped;
            continue;
        }

        engine::RangeDecision decision;
        if (!analyzer.analyze(s, target, decision, &error)) {
            out << fileName << ": Unplayable, full range " << score::rangeOfScore(s).toString() << Qt::endl;
            ++skipped;
            continue;
        }

        QString verdict = engine::playbackModeName(decision.mode);
        if (decision.mode == engine::PlaybackMode::MelodyOnly) {
            verdict += QString("(%1%2)").arg(decision.octaveShift > 0 ? "+" : "").arg(decision.octaveShift);
        }
        out << fileName << ": " << verdict << ", range " << decision.sourceRange.toString() << Qt::endl;

        if (fullOnly && decision.mode != engine::PlaybackMode::FullEnsemble) {
            ++skipped;
            continue;
        }
        ++accepted;

        if (!destDir.isEmpty()) {
            const QString copyPath = QDir(destDir).filePath(fileName);
            if ((QFile::exists(copyPath) && !QFile::remove(copyPath)) || !QFile::copy(path, copyPath)) {
                err << "  could not copy to " << copyPath << Qt::endl;
                ++errors;
            }
        }
    }

    out << "Accepted: " << accepted << ", skipped: " << skipped << ", errors: " << errors << Qt::endl;
    return errors > 0 ? 1 : 0;
}

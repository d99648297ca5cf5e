#include "ConfigLoader.h"
#include <QCommandLineParser>
#include <QFile>
#include <QDebug>

ConfigLoader::ConfigLoader() {}

PlayerConfig ConfigLoader::loadConfig(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Could not open config file:" << filePath;
        return PlayerConfig{};
    }
    return loadConfigData(file.readAll());
}

PlayerConfig ConfigLoader::loadConfigData(const QByteArray& data) {
    PlayerConfig config;
    QXmlStreamReader xml(data);

    if (xml.readNextStartElement()) {
        if (xml.name().toString() == "PianoPlayerConfig") {
            const QString name = xml.attributes().value("name").toString();
            if (!name.isEmpty()) config.name = name;
            while (xml.readNextStartElement()) {
                if (xml.name().toString() == "Settings") {
                    parseSettings(xml, config);
                } else if (xml.name().toString() == "Velocities") {
                    parseVelocities(xml, config);
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            qWarning() << "Config root element is not <PianoPlayerConfig>:" << xml.name().toString();
            return PlayerConfig{};
        }
    }

    if (xml.hasError()) {
        qWarning() << "XML parsing error:" << xml.errorString();
        return PlayerConfig{};
    }

    validate(config);
    config.isValid = true;
    return config;
}

void ConfigLoader::parseSettings(QXmlStreamReader& xml, PlayerConfig& config) {
    while (xml.readNextStartElement()) {
        QString elementName = xml.name().toString();
        if (elementName == "Mode") {
            const QString text = xml.readElementText();
            if (!pianoplayer::score::parseSelectionMode(text, config.mode)) {
                qWarning() << "Unknown mode in config:" << text;
            }
        } else if (elementName == "Tolerance") {
            config.tolerance = xml.readElementText().toInt();
        } else if (elementName == "AutoAdvanceDelayMs") {
            config.autoAdvanceDelayMs = xml.readElementText().toInt();
        } else if (elementName == "StaccatoFraction") {
            config.staccatoFraction = xml.readElementText().toDouble();
        } else if (elementName == "ScoresDirectory") {
            config.scoresDirectory = xml.readElementText().trimmed();
        } else if (elementName == "Backend") {
            const QString text = xml.readElementText();
            if (!pianoplayer::backend::parseBackendKind(text, config.backend)) {
                qWarning() << "Unknown backend in config:" << text;
            }
        } else if (elementName == "SampleDirectory") {
            config.backendSettings.sampleDirectory = xml.readElementText().trimmed();
        } else if (elementName == "MidiPort") {
            config.backendSettings.midiPortName = xml.readElementText().trimmed();
        } else if (elementName == "MidiChannel") {
            config.backendSettings.midiChannel = xml.readElementText().toInt();
        } else if (elementName == "PreferFlats") {
            config.backendSettings.preferFlats = (xml.readElementText().trimmed() == "true");
        } else {
            xml.skipCurrentElement();
        }
    }
}

void ConfigLoader::parseVelocities(QXmlStreamReader& xml, PlayerConfig& config) {
    static const char* kOrder[6] = {"pp", "p", "mp", "mf", "f", "ff"};
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "Velocity") {
            const QString dynamic = xml.attributes().value("dynamic").toString();
            const int value = xml.attributes().value("value").toInt();
            for (int i = 0; i < 6; ++i) {
                if (dynamic == kOrder[i]) config.velocities.values[size_t(i)] = value;
            }
        }
        xml.skipCurrentElement();
    }
}

void ConfigLoader::validate(PlayerConfig& config) {
    const PlayerConfig defaults;
    if (config.tolerance < 0) {
        qWarning() << "Negative tolerance in config, using" << defaults.tolerance;
        config.tolerance = defaults.tolerance;
    }
    if (config.autoAdvanceDelayMs < 0) {
        qWarning() << "Negative auto-advance delay in config, using" << defaults.autoAdvanceDelayMs;
        config.autoAdvanceDelayMs = defaults.autoAdvanceDelayMs;
    }
    if (config.staccatoFraction <= 0.0 || config.staccatoFraction > 1.0) {
        qWarning() << "Staccato fraction must be in (0, 1], using" << defaults.staccatoFraction;
        config.staccatoFraction = defaults.staccatoFraction;
    }
    if (!config.velocities.isMonotonic()) {
        qWarning() << "Velocity table must rise strictly from pp to ff within 1..127, using defaults";
        config.velocities = defaults.velocities;
    }
    if (config.backendSettings.midiChannel < 1 || config.backendSettings.midiChannel > 16) {
        qWarning() << "MIDI channel must be 1..16, using" << defaults.backendSettings.midiChannel;
        config.backendSettings.midiChannel = defaults.backendSettings.midiChannel;
    }
    if (config.scoresDirectory.isEmpty()) config.scoresDirectory = defaults.scoresDirectory;
}

void ConfigLoader::addCommandLineOptions(QCommandLineParser& parser) {
    parser.addOptions({
        {"config", "Read settings from <file> instead of the embedded defaults.", "file"},
        {"mode", "Score order: sequential or random.", "mode"},
        {"tolerance", "Semitones a score may exceed the backend range and still play in full.", "semitones"},
        {"backend", "Output backend: keys, sample or midi.", "backend"},
        {"directory", "Directory with .musicxml scores.", "dir"},
        {"midi-port", "MIDI output port name (substring match).", "name"},
        {"samples", "Directory with the piano samples.", "dir"},
        {"verbose", "Print debug output."},
    });
}

void ConfigLoader::applyCommandLine(const QCommandLineParser& parser, PlayerConfig& config) {
    const PlayerConfig defaults;

    if (parser.isSet("mode") && !pianoplayer::score::parseSelectionMode(parser.value("mode"), config.mode)) {
        qWarning().noquote() << "Invalid --mode" << parser.value("mode") << "- using"
                             << pianoplayer::score::selectionModeName(defaults.mode);
        config.mode = defaults.mode;
    }
    if (parser.isSet("tolerance")) {
        bool ok = false;
        const int t = parser.value("tolerance").toInt(&ok);
        if (ok && t >= 0) {
            config.tolerance = t;
        } else {
            qWarning().noquote() << "Invalid --tolerance" << parser.value("tolerance") << "- using" << defaults.tolerance;
            config.tolerance = defaults.tolerance;
        }
    }
    if (parser.isSet("backend") && !pianoplayer::backend::parseBackendKind(parser.value("backend"), config.backend)) {
        qWarning().noquote() << "Invalid --backend" << parser.value("backend") << "- using"
                             << pianoplayer::backend::backendKindName(defaults.backend);
        config.backend = defaults.backend;
    }
    if (parser.isSet("directory")) config.scoresDirectory = parser.value("directory");
    if (parser.isSet("midi-port")) config.backendSettings.midiPortName = parser.value("midi-port");
    if (parser.isSet("samples")) config.backendSettings.sampleDirectory = parser.value("samples");
    if (parser.isSet("verbose")) config.verbose = true;
}

#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QByteArray>
#include <QString>
#include <QXmlStreamReader>
#include "PlayerConfig.h"

class QCommandLineParser;

class ConfigLoader {
public:
    ConfigLoader();

    // Defaults overlaid with the XML file (":/pianoplayer.xml" for the embedded one).
    PlayerConfig loadConfig(const QString& filePath);
    PlayerConfig loadConfigData(const QByteArray& data);

    // --config, --mode, --tolerance, --backend, --directory, --midi-port, --samples, --verbose
    static void addCommandLineOptions(QCommandLineParser& parser);
    // Overlays parsed options; invalid values are reported and left at their previous value.
    static void applyCommandLine(const QCommandLineParser& parser, PlayerConfig& config);

private:
    void parseSettings(QXmlStreamReader& xml, PlayerConfig& config);
    void parseVelocities(QXmlStreamReader& xml, PlayerConfig& config);
    void validate(PlayerConfig& config);
};

#endif // CONFIGLOADER_H

#ifndef PLAYERCONFIG_H
#define PLAYERCONFIG_H

#include <QString>

#include "pianoplayer/backend/BackendFactory.h"
#include "pianoplayer/backend/OutputBackend.h"
#include "pianoplayer/engine/Timeline.h"
#include "pianoplayer/score/ScoreLibrary.h"

// Everything the player reads at startup: built-in defaults, then the XML
// config, then command line options.
struct PlayerConfig {
    QString name = "default";
    QString scoresDirectory = "scores";

    pianoplayer::score::SelectionMode mode = pianoplayer::score::SelectionMode::Random;
    int tolerance = 0;               // semitones beyond the backend range still played in full
    int autoAdvanceDelayMs = 3000;   // pause between a finished score and the next one
    double staccatoFraction = 0.5;   // sounding fraction of a staccato note
    pianoplayer::engine::VelocityTable velocities;

    pianoplayer::backend::BackendKind backend = pianoplayer::backend::BackendKind::KeySimulation;
    pianoplayer::backend::BackendSettings backendSettings;

    bool verbose = false;
    bool isValid = false; // false when the config file could not be read or parsed
};

#endif // PLAYERCONFIG_H

#pragma once

#include <QString>

#include <memory>

#include "pianoplayer/backend/OutputBackend.h"

namespace pianoplayer::backend {

struct BackendSettings {
    QString sampleDirectory = "samples/piano";
    QString midiPortName;
    int midiChannel = 1;
    bool preferFlats = false;
};

// Unopened backend of the given kind (key simulation uses the X11 XTest injector).
std::unique_ptr<OutputBackend> createBackend(BackendKind kind, const BackendSettings& settings);

// Creates and opens `kind`. If that fails and `kind` is not already key
// simulation, falls back to key simulation with a warning. Returns nullptr
// (and fills `error`) only when nothing could be opened.
std::unique_ptr<OutputBackend> openBackendWithFallback(BackendKind kind,
                                                       const BackendSettings& settings,
                                                       QString* error = nullptr);

} // namespace pianoplayer::backend

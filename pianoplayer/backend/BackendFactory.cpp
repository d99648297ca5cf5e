#include "pianoplayer/backend/BackendFactory.h"

#include <QDebug>

#include "pianoplayer/backend/KeySimulationBackend.h"
#include "pianoplayer/backend/MidiBackend.h"
#include "pianoplayer/backend/SampleBackend.h"
#include "pianoplayer/backend/XTestKeyInjector.h"

namespace pianoplayer::backend {

std::unique_ptr<OutputBackend> createBackend(BackendKind kind, const BackendSettings& settings) {
    switch (kind) {
    case BackendKind::KeySimulation:
        return std::make_unique<KeySimulationBackend>(std::make_unique<XTestKeyInjector>(), settings.preferFlats);
    case BackendKind::Sample:
        return std::make_unique<SampleBackend>(settings.sampleDirectory);
    case BackendKind::Midi:
        return std::make_unique<MidiBackend>(settings.midiPortName, settings.midiChannel);
    }
    return nullptr;
}

std::unique_ptr<OutputBackend> openBackendWithFallback(BackendKind kind,
                                                       const BackendSettings& settings,
                                                       QString* error) {
    std::unique_ptr<OutputBackend> backend = createBackend(kind, settings);
    QString why;
    if (backend && backend->open(&why)) return backend;

    qWarning().noquote() << QString("BackendFactory: %1 backend failed to open: %2").arg(backendKindName(kind), why);
    if (kind == BackendKind::KeySimulation) {
        if (error) *error = why;
        return nullptr;
    }

    qWarning() << "BackendFactory: falling back to key simulation";
    backend = createBackend(BackendKind::KeySimulation, settings);
    QString fallbackWhy;
    if (backend->open(&fallbackWhy)) return backend;

    if (error) *error = QString("%1; key simulation fallback: %2").arg(why, fallbackWhy);
    return nullptr;
}

} // namespace pianoplayer::backend

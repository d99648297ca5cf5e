#include "pianoplayer/backend/OutputBackend.h"

namespace pianoplayer::backend {

QString backendKindName(BackendKind k) {
    switch (k) {
    case BackendKind::KeySimulation: return "keys";
    case BackendKind::Sample: return "sample";
    case BackendKind::Midi: return "midi";
    }
    return "unknown";
}

bool parseBackendKind(const QString& text, BackendKind& out) {
    const QString t = text.trimmed().toLower();
    if (t == "keys" || t == "keysim" || t == "pynput" || t == "keyboard") {
        out = BackendKind::KeySimulation;
        return true;
    }
    if (t == "sample" || t == "samples") {
        out = BackendKind::Sample;
        return true;
    }
    if (t == "midi") {
        out = BackendKind::Midi;
        return true;
    }
    return false;
}

} // namespace pianoplayer::backend

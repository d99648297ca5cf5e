#include "pianoplayer/backend/KeySimulationBackend.h"

#include <QDebug>

#include "pianoplayer/score/PitchNames.h"

namespace pianoplayer::backend {

namespace {

// White keys C D E F G A B per octave row, C3 row first.
static const char* const kRows[3] = {"zxcvbnm", "asdfghj", "qwertyu"};

// Pitch class -> index of the white key in its row (-1 for black keys).
static const int kWhiteIndex[12] = {0, -1, 1, -1, 2, 3, -1, 4, -1, 5, -1, 6};

static char whiteKey(int pitch) {
    const int row = (pitch - KeySimulationBackend::kLowestPitch) / 12;
    const int idx = kWhiteIndex[score::normalizePc(pitch)];
    if (row < 0 || row > 2 || idx < 0) return 0;
    return kRows[row][idx];
}

} // namespace

KeySimulationBackend::KeySimulationBackend(std::unique_ptr<KeyInjector> injector, bool preferFlats)
    : m_injector(std::move(injector)), m_preferFlats(preferFlats) {}

KeySimulationBackend::~KeySimulationBackend() {
    close();
}

bool KeySimulationBackend::keyForPitch(int pitch, bool preferFlats, KeyStroke& out) {
    if (pitch < kLowestPitch || pitch > kHighestPitch) return false;

    if (!score::isBlackKey(pitch)) {
        out = KeyStroke{whiteKey(pitch), KeyModifier::None};
        return true;
    }
    // Black keys never sit at the edges of C3-B5, so both neighbours exist.
    if (preferFlats) {
        out = KeyStroke{whiteKey(pitch + 1), KeyModifier::Control};
    } else {
        out = KeyStroke{whiteKey(pitch - 1), KeyModifier::Shift};
    }
    return true;
}

bool KeySimulationBackend::open(QString* error) {
    if (m_open) return true;
    if (!m_injector) {
        if (error) *error = "no key injector";
        return false;
    }
    QString why;
    if (!m_injector->open(&why)) {
        if (error) *error = QString("key simulation unavailable: %1").arg(why);
        return false;
    }
    m_open = true;
    qInfo().noquote() << QString("KeySimulationBackend: ready (%1 spelling)").arg(m_preferFlats ? "flat" : "sharp");
    return true;
}

void KeySimulationBackend::close() {
    if (!m_open) return;
    QString why;
    if (!m_injector->releaseAll(&why)) {
        qWarning().noquote() << "KeySimulationBackend: releasing modifiers failed:" << why;
    }
    m_injector->close();
    m_open = false;
}

bool KeySimulationBackend::noteOn(int pitch, int velocity, QString* error) {
    Q_UNUSED(velocity);
    if (!m_open) {
        if (error) *error = "key simulation backend is not open";
        return false;
    }
    KeyStroke stroke;
    if (!keyForPitch(pitch, m_preferFlats, stroke)) {
        if (error) *error = QString("pitch %1 has no key").arg(score::noteName(pitch));
        return false;
    }
    return m_injector->tap(stroke, error);
}

bool KeySimulationBackend::noteOff(int pitch, QString* error) {
    // Taps have no release phase.
    Q_UNUSED(pitch);
    Q_UNUSED(error);
    return true;
}

bool KeySimulationBackend::allNotesOff(QString* error) {
    if (!m_open) return true;
    return m_injector->releaseAll(error);
}

} // namespace pianoplayer::backend

#pragma once

#include <QString>

#include "pianoplayer/score/PitchRange.h"

namespace pianoplayer::backend {

enum class BackendKind {
    KeySimulation,
    Sample,
    Midi,
};

QString backendKindName(BackendKind k);
// Accepts "keys", "pynput", "keysim", "sample", "midi" (case-insensitive).
bool parseBackendKind(const QString& text, BackendKind& out);

// Output device contract shared by every backend.
//
// noteOn()/noteOff()/allNotesOff() are called from the scheduler thread while a
// session runs; exactly one session drives a backend at a time. A false return
// means the device failed; `error` (if given) receives a description.
class OutputBackend {
public:
    virtual ~OutputBackend() = default;

    virtual BackendKind kind() const = 0;
    virtual QString name() const = 0;

    virtual bool open(QString* error = nullptr) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual bool noteOn(int pitch, int velocity, QString* error = nullptr) = 0;
    virtual bool noteOff(int pitch, QString* error = nullptr) = 0;

    // Panic: silence everything this backend may still be sounding.
    virtual bool allNotesOff(QString* error = nullptr) = 0;

    virtual score::PitchRange supportedRange() const = 0;

    // false: long/tied notes may be rendered as a single short trigger.
    virtual bool supportsSustain() const = 0;
    // false: velocities are accepted and ignored.
    virtual bool supportsVelocity() const = 0;
};

} // namespace pianoplayer::backend

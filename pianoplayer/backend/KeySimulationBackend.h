#pragma once

#include <memory>

#include "pianoplayer/backend/KeyInjector.h"
#include "pianoplayer/backend/OutputBackend.h"

namespace pianoplayer::backend {

// Plays notes by typing on a virtual piano keyboard (three rows of the
// typing keyboard, one octave each). Every note is a single key tap.
class KeySimulationBackend final : public OutputBackend {
public:
    static constexpr int kLowestPitch = 48;  // C3
    static constexpr int kHighestPitch = 83; // B5

    explicit KeySimulationBackend(std::unique_ptr<KeyInjector> injector, bool preferFlats = false);
    ~KeySimulationBackend() override;

    // Key stroke for a pitch; false outside C3-B5. Black keys are Shift + the
    // white key below (sharp) or Ctrl + the white key above (flat).
    static bool keyForPitch(int pitch, bool preferFlats, KeyStroke& out);

    BackendKind kind() const override { return BackendKind::KeySimulation; }
    QString name() const override { return "Key simulation"; }

    bool open(QString* error = nullptr) override;
    void close() override;
    bool isOpen() const override { return m_open; }

    bool noteOn(int pitch, int velocity, QString* error = nullptr) override;
    bool noteOff(int pitch, QString* error = nullptr) override;
    bool allNotesOff(QString* error = nullptr) override;

    score::PitchRange supportedRange() const override { return {kLowestPitch, kHighestPitch}; }
    bool supportsSustain() const override { return false; }
    bool supportsVelocity() const override { return false; }

    bool prefersFlats() const { return m_preferFlats; }

private:
    std::unique_ptr<KeyInjector> m_injector;
    bool m_preferFlats = false;
    bool m_open = false;
};

} // namespace pianoplayer::backend

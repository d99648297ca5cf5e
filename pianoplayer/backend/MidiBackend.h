#pragma once

#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <vector>

#include "pianoplayer/backend/OutputBackend.h"

class RtMidiOut;

namespace pianoplayer::backend {

// MIDI output through RtMidi. Opens the first port whose name contains the
// configured name (case-insensitive), else the first available port, else a
// virtual port other software can connect to.
class MidiBackend final : public OutputBackend {
public:
    static constexpr const char* kVirtualPortName = "Piano Player";

    explicit MidiBackend(const QString& portName = QString(), int channel = 1);
    ~MidiBackend() override;

    // Index of the port to open among `ports`, -1 when there is none.
    static int choosePort(const QStringList& ports, const QString& wanted);

    BackendKind kind() const override { return BackendKind::Midi; }
    QString name() const override;

    bool open(QString* error = nullptr) override;
    void close() override;
    bool isOpen() const override;

    bool noteOn(int pitch, int velocity, QString* error = nullptr) override;
    bool noteOff(int pitch, QString* error = nullptr) override;
    bool allNotesOff(QString* error = nullptr) override;

    score::PitchRange supportedRange() const override { return {0, 127}; }
    bool supportsSustain() const override { return true; }
    bool supportsVelocity() const override { return true; }

    int channel() const { return m_channel; }

private:
    bool send(const std::vector<unsigned char>& msg, QString* error);

    QString m_wantedPort;
    QString m_openedPort;
    int m_channel = 1; // 1..16

    mutable std::mutex m_mutex;
    std::unique_ptr<RtMidiOut> m_out;
};

} // namespace pianoplayer::backend

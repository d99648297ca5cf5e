#include "pianoplayer/backend/MidiBackend.h"

#include <QDebug>

#include "RtMidi.h"

namespace pianoplayer::backend {

namespace {
constexpr unsigned char kAllNotesOffCc = 123;
}

MidiBackend::MidiBackend(const QString& portName, int channel)
    : m_wantedPort(portName.trimmed()) {
    if (channel < 1 || channel > 16) {
        qWarning() << "MidiBackend: channel" << channel << "out of range, using 1";
        channel = 1;
    }
    m_channel = channel;
}

MidiBackend::~MidiBackend() {
    close();
}

QString MidiBackend::name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_openedPort.isEmpty() ? QString("MIDI") : QString("MIDI (%1)").arg(m_openedPort);
}

int MidiBackend::choosePort(const QStringList& ports, const QString& wanted) {
    if (ports.isEmpty()) return -1;
    if (!wanted.isEmpty()) {
        for (int i = 0; i < ports.size(); ++i) {
            if (ports.at(i).contains(wanted, Qt::CaseInsensitive)) return i;
        }
    }
    return 0;
}

bool MidiBackend::open(QString* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_out) return true;

    try {
        auto out = std::make_unique<RtMidiOut>(RtMidi::UNSPECIFIED, kVirtualPortName);

        QStringList ports;
        const unsigned int count = out->getPortCount();
        for (unsigned int i = 0; i < count; ++i) {
            ports << QString::fromStdString(out->getPortName(i));
        }
        qDebug().noquote() << "MidiBackend: available ports:" << ports.join(", ");

        const int index = choosePort(ports, m_wantedPort);
        if (index >= 0) {
            if (!m_wantedPort.isEmpty() && !ports.at(index).contains(m_wantedPort, Qt::CaseInsensitive)) {
                qWarning().noquote() << QString("MidiBackend: no port matches '%1', using '%2'")
                                            .arg(m_wantedPort, ports.at(index));
            }
            out->openPort(unsigned(index), kVirtualPortName);
            m_openedPort = ports.at(index);
        } else {
            out->openVirtualPort(kVirtualPortName);
            m_openedPort = QString("virtual: %1").arg(kVirtualPortName);
        }
        m_out = std::move(out);
    } catch (const RtMidiError& e) {
        if (error) *error = QString("MIDI output unavailable: %1").arg(QString::fromStdString(e.getMessage()));
        m_openedPort.clear();
        return false;
    }

    qInfo().noquote() << QString("MidiBackend: opened '%1' on channel %2").arg(m_openedPort).arg(m_channel);
    return true;
}

void MidiBackend::close() {
    QString why;
    if (isOpen() && !allNotesOff(&why)) {
        qWarning().noquote() << "MidiBackend: all-notes-off on close failed:" << why;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_out) return;
    try {
        m_out->closePort();
    } catch (const RtMidiError& e) {
        qWarning().noquote() << "MidiBackend: closing port failed:" << QString::fromStdString(e.getMessage());
    }
    m_out.reset();
    m_openedPort.clear();
}

bool MidiBackend::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_out != nullptr;
}

bool MidiBackend::send(const std::vector<unsigned char>& msg, QString* error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_out) {
        if (error) *error = "MIDI output is not open";
        return false;
    }
    try {
        m_out->sendMessage(&msg);
    } catch (const RtMidiError& e) {
        if (error) *error = QString("MIDI send failed: %1").arg(QString::fromStdString(e.getMessage()));
        return false;
    }
    return true;
}

bool MidiBackend::noteOn(int pitch, int velocity, QString* error) {
    const unsigned char chan = (unsigned char)(m_channel - 1);
    const std::vector<unsigned char> msg = {(unsigned char)(0x90 | chan), (unsigned char)qBound(0, pitch, 127),
                                            (unsigned char)qBound(1, velocity, 127)};
    return send(msg, error);
}

bool MidiBackend::noteOff(int pitch, QString* error) {
    const unsigned char chan = (unsigned char)(m_channel - 1);
    const std::vector<unsigned char> msg = {(unsigned char)(0x80 | chan), (unsigned char)qBound(0, pitch, 127), 0};
    return send(msg, error);
}

bool MidiBackend::allNotesOff(QString* error) {
    const unsigned char chan = (unsigned char)(m_channel - 1);
    const std::vector<unsigned char> msg = {(unsigned char)(0xB0 | chan), kAllNotesOffCc, 0};
    return send(msg, error);
}

} // namespace pianoplayer::backend

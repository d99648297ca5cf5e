#pragma once

#include <QString>
#include <QVector>

namespace pianoplayer::score {

enum class Dynamic {
    None,
    PP,
    P,
    MP,
    MF,
    F,
    FF,
};

struct Note {
    int pitch = 60;           // 0..127 (MIDI numbering, 60 = C4)
    double onsetBeat = 0.0;   // quarter-note beats from the start of the score
    double durationBeats = 1.0;
    Dynamic dynamic = Dynamic::None;
    bool staccato = false;
    bool tiedFromPrevious = false;
    bool tiedToNext = false;
};

struct Voice {
    QString name;          // e.g. "Piano", "Violin I"
    QVector<Note> notes;   // ordered by onsetBeat
};

struct TempoChange {
    double beat = 0.0;
    double bpm = 120.0;
};

// Piecewise-constant tempo. Beats are quarter notes.
class TempoMap final {
public:
    static constexpr double kDefaultBpm = 120.0;

    // Changes may arrive in any order; non-positive tempos are ignored.
    void addChange(double beat, double bpm);
    const QVector<TempoChange>& changes() const { return m_changes; }
    bool isEmpty() const { return m_changes.isEmpty(); }

    double bpmAt(double beat) const;

    // Absolute seconds at a beat position, integrating every tempo segment before it.
    double secondsAt(double beat) const;

private:
    QVector<TempoChange> m_changes; // sorted by beat
};

// Immutable once loaded (callers receive it by const reference / shared_ptr<const Score>).
struct Score {
    QString title;
    QString sourcePath;
    QVector<Voice> voices;
    TempoMap tempo;

    double totalBeats() const;
    int noteCount() const;
};

} // namespace pianoplayer::score

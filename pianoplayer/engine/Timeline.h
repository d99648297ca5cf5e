#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include <array>
#include <memory>

#include "pianoplayer/engine/RangeAnalyzer.h"

namespace pianoplayer::engine {

struct TimelineEvent {
    enum class Kind {
        NoteOn,
        NoteOff,
    };

    double timeSec = 0.0;  // absolute, from the start of the score
    Kind kind = Kind::NoteOn;
    int pitch = 0;         // after transposition
    int velocity = 0;      // 1..127 (0 on NoteOff)
    double gateSec = 0.0;  // sounding duration of the note this event belongs to
    int voice = 0;
    quint32 noteId = 0;    // pairs NoteOn/NoteOff; stale NoteOffs for retriggered pitches are dropped

    bool operator==(const TimelineEvent& o) const {
        return timeSec == o.timeSec && kind == o.kind && pitch == o.pitch && velocity == o.velocity &&
               gateSec == o.gateSec && voice == o.voice && noteId == o.noteId;
    }
    bool operator!=(const TimelineEvent& o) const { return !(*this == o); }
};

struct Timeline {
    QString title;
    QString sourcePath;
    RangeDecision decision;
    QVector<TimelineEvent> events; // time non-decreasing; NoteOff before NoteOn at equal times
    double durationSec = 0.0;

    int noteCount() const { return events.size() / 2; }
};

using TimelinePtr = std::shared_ptr<const Timeline>;

// Dynamic marking -> velocity. Must stay monotonic (pp < p < mp < mf < f < ff).
struct VelocityTable {
    std::array<int, 6> values{{33, 49, 64, 80, 96, 112}}; // pp, p, mp, mf, f, ff

    int forDynamic(score::Dynamic d) const;
    bool isMonotonic() const;
};

} // namespace pianoplayer::engine

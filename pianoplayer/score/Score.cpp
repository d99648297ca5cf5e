#include "pianoplayer/score/Score.h"

#include <QtGlobal>

#include <algorithm>

namespace pianoplayer::score {

void TempoMap::addChange(double beat, double bpm) {
    if (bpm <= 0.0) return;
    beat = std::max(0.0, beat);

    // A later mark at the same beat replaces the earlier one.
    for (auto& c : m_changes) {
        if (qFuzzyCompare(c.beat + 1.0, beat + 1.0)) {
            c.bpm = bpm;
            return;
        }
    }

    const auto it = std::upper_bound(m_changes.begin(), m_changes.end(), beat,
                                     [](double b, const TempoChange& c) { return b < c.beat; });
    m_changes.insert(it, TempoChange{beat, bpm});
}

double TempoMap::bpmAt(double beat) const {
    double bpm = kDefaultBpm;
    for (const auto& c : m_changes) {
        if (c.beat > beat) break;
        bpm = c.bpm;
    }
    return bpm;
}

double TempoMap::secondsAt(double beat) const {
    if (beat <= 0.0) return 0.0;

    double seconds = 0.0;
    double segStart = 0.0;
    double segBpm = kDefaultBpm;
    for (const auto& c : m_changes) {
        if (c.beat >= beat) break;
        seconds += (c.beat - segStart) * 60.0 / segBpm;
        segStart = c.beat;
        segBpm = c.bpm;
    }
    seconds += (beat - segStart) * 60.0 / segBpm;
    return seconds;
}

double Score::totalBeats() const {
    double end = 0.0;
    for (const auto& v : voices) {
        for (const auto& n : v.notes) {
            end = std::max(end, n.onsetBeat + n.durationBeats);
        }
    }
    return end;
}

int Score::noteCount() const {
    int count = 0;
    for (const auto& v : voices) count += v.notes.size();
    return count;
}

} // namespace pianoplayer::score

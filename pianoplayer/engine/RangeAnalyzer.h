#pragma once

#include <QVector>

#include "pianoplayer/engine/PlaybackError.h"
#include "pianoplayer/score/PitchRange.h"
#include "pianoplayer/score/Score.h"

namespace pianoplayer::engine {

enum class PlaybackMode {
    FullEnsemble,
    MelodyOnly,
};

QString playbackModeName(PlaybackMode m);

struct RangeDecision {
    PlaybackMode mode = PlaybackMode::FullEnsemble;
    QVector<int> voices;   // indices into Score::voices
    int octaveShift = 0;   // semitones, always a multiple of 12

    // Backend range the decision was made against; the sequencer folds
    // any tolerance overhang back into it.
    score::PitchRange target;

    score::PitchRange sourceRange; // range of the selected voices before shifting

    bool operator==(const RangeDecision& o) const {
        return mode == o.mode && voices == o.voices && octaveShift == o.octaveShift && target == o.target;
    }
    bool operator!=(const RangeDecision& o) const { return !(*this == o); }

    QString describe() const; // "Full Score" / "Melody Only+Transposed(+12)"
};

// Decides which voices to play and how far to transpose them so the result
// fits a backend's pitch range.
//
// 1) Whole score inside [lo - tolerance, hi + tolerance]: FullEnsemble, no shift.
// 2) Else the first voice (melody), if no wider than the backend, shifted by the
//    smallest whole-octave step that lands it inside [lo, hi]. Ties go down.
// 3) Else UnplayableScore.
class RangeAnalyzer final {
public:
    explicit RangeAnalyzer(int tolerance = 0) { setTolerance(tolerance); }

    void setTolerance(int semitones) { m_tolerance = semitones < 0 ? 0 : semitones; }
    int tolerance() const { return m_tolerance; }

    bool analyze(const score::Score& score,
                 const score::PitchRange& backendRange,
                 RangeDecision& out,
                 PlaybackError* err = nullptr) const;

    // Minimal |k*12| shift placing `melody` inside `target`; ties prefer the downward shift.
    // Returns false when no whole-octave shift works.
    static bool minimalOctaveShift(const score::PitchRange& melody,
                                   const score::PitchRange& target,
                                   int& shiftOut);

private:
    int m_tolerance = 0;
};

} // namespace pianoplayer::engine

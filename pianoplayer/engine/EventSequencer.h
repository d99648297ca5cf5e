#pragma once

#include "pianoplayer/engine/PlaybackError.h"
#include "pianoplayer/engine/RangeAnalyzer.h"
#include "pianoplayer/engine/Timeline.h"
#include "pianoplayer/score/Score.h"

namespace pianoplayer::engine {

struct SequencerPolicy {
    // Fraction of the notated duration a staccato note sounds for.
    double staccatoFraction = 0.5;
    VelocityTable velocities;
};

// Flattens a score into a time-ordered NoteOn/NoteOff timeline:
// - beats -> seconds through the tempo map
// - octave shift (MelodyOnly) or per-note folding of the tolerance overhang (FullEnsemble)
// - tied chains merged into a single pair
// - staccato shortens only the NoteOff
// - dynamics mapped to velocity, inherited within a voice (default mf)
// Output is deterministic for a given (score, decision, policy).
class EventSequencer final {
public:
    explicit EventSequencer(const SequencerPolicy& policy = SequencerPolicy{});

    void setPolicy(const SequencerPolicy& policy);
    const SequencerPolicy& policy() const { return m_policy; }

    bool sequence(const score::Score& score,
                  const RangeDecision& decision,
                  Timeline& out,
                  PlaybackError* err = nullptr) const;

    // Pitch after the decision's shift, folded by octaves into the decision target.
    static int mapPitch(int pitch, const RangeDecision& decision);

private:
    SequencerPolicy m_policy;
};

} // namespace pianoplayer::engine

#include "pianoplayer/engine/RangeAnalyzer.h"

#include <QDebug>

namespace pianoplayer::engine {

QString playbackModeName(PlaybackMode m) {
    switch (m) {
    case PlaybackMode::FullEnsemble: return "FullEnsemble";
    case PlaybackMode::MelodyOnly: return "MelodyOnly";
    }
    return "Unknown";
}

QString RangeDecision::describe() const {
    if (mode == PlaybackMode::FullEnsemble) return "Full Score";
    if (octaveShift == 0) return "Melody Only";
    return QString("Melody Only+Transposed(%1%2)").arg(octaveShift > 0 ? "+" : "").arg(octaveShift);
}

bool RangeAnalyzer::minimalOctaveShift(const score::PitchRange& melody,
                                       const score::PitchRange& target,
                                       int& shiftOut) {
    if (!melody.isValid() || !target.isValid()) return false;
    if (melody.width() > target.width()) return false;

    // 11 octaves covers the whole 0..127 space.
    for (int k = 0; k <= 11; ++k) {
        if (target.contains(melody.shifted(-12 * k))) {
            shiftOut = -12 * k;
            return true;
        }
        if (k > 0 && target.contains(melody.shifted(12 * k))) {
            shiftOut = 12 * k;
            return true;
        }
    }
    return false;
}

bool RangeAnalyzer::analyze(const score::Score& score,
                            const score::PitchRange& backendRange,
                            RangeDecision& out,
                            PlaybackError* err) const {
    out = RangeDecision{};
    out.target = backendRange;

    if (!backendRange.isValid()) {
        return fail(err, ErrorKind::UnplayableScore, "backend reports an empty pitch range");
    }

    const score::PitchRange full = score::rangeOfScore(score);
    const score::PitchRange allowed = backendRange.widened(m_tolerance);

    // No notes at all is left for the sequencer to report as an empty timeline.
    if (!full.isValid() || allowed.contains(full)) {
        out.mode = PlaybackMode::FullEnsemble;
        for (int i = 0; i < score.voices.size(); ++i) out.voices.push_back(i);
        out.octaveShift = 0;
        out.sourceRange = full;
        qDebug().noquote() << QString("RangeAnalyzer: full score %1 fits %2 (tolerance %3)")
                                  .arg(full.toString(), backendRange.toString())
                                  .arg(m_tolerance);
        return true;
    }

    if (score.voices.isEmpty()) {
        return fail(err, ErrorKind::UnplayableScore, "score has no voices to fall back on");
    }

    const score::PitchRange melody = score::rangeOfVoice(score, 0);
    out.mode = PlaybackMode::MelodyOnly;
    out.voices = {0};
    out.sourceRange = melody;

    if (!melody.isValid()) {
        // Melody voice is silent; the sequencer turns this into EmptyTimeline.
        return true;
    }

    int shift = 0;
    if (!minimalOctaveShift(melody, backendRange, shift)) {
        return fail(err, ErrorKind::UnplayableScore,
                    QString("melody range %1 cannot be placed inside backend range %2 (full score %3)")
                        .arg(melody.toString(), backendRange.toString(), full.toString()));
    }

    out.octaveShift = shift;
    qDebug().noquote() << QString("RangeAnalyzer: full score %1 exceeds %2, melody %3 shifted by %4")
                              .arg(full.toString(), allowed.toString(), melody.toString())
                              .arg(shift);
    return true;
}

} // namespace pianoplayer::engine

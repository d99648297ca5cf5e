#include "pianoplayer/score/PitchRange.h"

#include "pianoplayer/score/PitchNames.h"
#include "pianoplayer/score/Score.h"

namespace pianoplayer::score {

QString PitchRange::toString() const {
    if (!isValid()) return QStringLiteral("empty");
    return QString("%1-%2 (%3-%4)")
        .arg(noteName(lowest), noteName(highest))
        .arg(lowest)
        .arg(highest);
}

PitchRange rangeOfVoice(const Score& score, int voiceIndex) {
    PitchRange r;
    if (voiceIndex < 0 || voiceIndex >= score.voices.size()) return r;
    for (const auto& n : score.voices[voiceIndex].notes) r.include(n.pitch);
    return r;
}

PitchRange rangeOfScore(const Score& score) {
    PitchRange r;
    for (int i = 0; i < score.voices.size(); ++i) {
        const PitchRange v = rangeOfVoice(score, i);
        if (!v.isValid()) continue;
        r.include(v.lowest);
        r.include(v.highest);
    }
    return r;
}

} // namespace pianoplayer::score

#pragma once

#include <QString>

namespace pianoplayer::score {

struct Score;

// Inclusive semitone range. lowest > highest means "no notes".
struct PitchRange {
    int lowest = 1;
    int highest = 0;

    bool isValid() const { return lowest <= highest; }
    int width() const { return isValid() ? highest - lowest : -1; }

    bool contains(int pitch) const { return pitch >= lowest && pitch <= highest; }
    bool contains(const PitchRange& other) const {
        return other.isValid() && other.lowest >= lowest && other.highest <= highest;
    }

    PitchRange shifted(int semitones) const {
        if (!isValid()) return *this;
        return PitchRange{lowest + semitones, highest + semitones};
    }
    PitchRange widened(int semitones) const { return PitchRange{lowest - semitones, highest + semitones}; }

    void include(int pitch) {
        if (!isValid()) {
            lowest = highest = pitch;
            return;
        }
        if (pitch < lowest) lowest = pitch;
        if (pitch > highest) highest = pitch;
    }

    bool operator==(const PitchRange& o) const { return lowest == o.lowest && highest == o.highest; }
    bool operator!=(const PitchRange& o) const { return !(*this == o); }

    // "C3-B5 (48-83)" or "empty".
    QString toString() const;
};

PitchRange rangeOfVoice(const Score& score, int voiceIndex);
PitchRange rangeOfScore(const Score& score);

} // namespace pianoplayer::score

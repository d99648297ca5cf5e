#include "pianoplayer/engine/EventSequencer.h"

#include <QDebug>
#include <QMap>

#include <algorithm>
#include <cmath>

namespace pianoplayer::engine {

namespace {

// Tie continuations must start where the chain ends (in beats).
constexpr double kTieJoinEpsilonBeats = 1e-3;

struct SoundingNote {
    int voice = 0;
    int pitch = 0;
    double startBeat = 0.0;
    double endBeat = 0.0;
    int velocity = 0;
    bool staccato = false;
};

static bool eventLess(const TimelineEvent& a, const TimelineEvent& b) {
    if (a.timeSec != b.timeSec) return a.timeSec < b.timeSec;
    if (a.kind != b.kind) return a.kind == TimelineEvent::Kind::NoteOff;
    if (a.voice != b.voice) return a.voice < b.voice;
    if (a.pitch != b.pitch) return a.pitch < b.pitch;
    return a.noteId < b.noteId;
}

// Collapses one voice's notes into sounding notes (ties merged), in onset order.
static QVector<SoundingNote> mergeVoice(const score::Voice& voice, int voiceIndex, const VelocityTable& velocities) {
    QVector<score::Note> notes = voice.notes;
    std::stable_sort(notes.begin(), notes.end(),
                     [](const score::Note& a, const score::Note& b) { return a.onsetBeat < b.onsetBeat; });

    QVector<SoundingNote> out;
    QMap<int, SoundingNote> open; // source pitch -> chain waiting for its continuation
    score::Dynamic current = score::Dynamic::MF;

    auto close = [&](int pitch) {
        auto it = open.find(pitch);
        if (it == open.end()) return;
        out.push_back(it.value());
        open.erase(it);
    };

    for (const auto& n : notes) {
        if (n.dynamic != score::Dynamic::None) current = n.dynamic;
        if (n.durationBeats <= 0.0) continue;

        const double end = n.onsetBeat + n.durationBeats;
        auto it = open.find(n.pitch);
        const bool continues = n.tiedFromPrevious && it != open.end() &&
                               std::abs(it.value().endBeat - n.onsetBeat) <= kTieJoinEpsilonBeats;

        if (continues) {
            it.value().endBeat = std::max(it.value().endBeat, end);
            it.value().staccato = n.staccato;
        } else {
            // A chain that expected a continuation but got a fresh attack ends here.
            close(n.pitch);
            SoundingNote s;
            s.voice = voiceIndex;
            s.pitch = n.pitch;
            s.startBeat = n.onsetBeat;
            s.endBeat = end;
            s.velocity = velocities.forDynamic(current);
            s.staccato = n.staccato;
            open.insert(n.pitch, s);
        }

        if (!n.tiedToNext) close(n.pitch);
    }

    // Dangling ties end with their last note.
    for (auto it = open.cbegin(); it != open.cend(); ++it) out.push_back(it.value());

    std::stable_sort(out.begin(), out.end(), [](const SoundingNote& a, const SoundingNote& b) {
        if (a.startBeat != b.startBeat) return a.startBeat < b.startBeat;
        return a.pitch < b.pitch;
    });
    return out;
}

} // namespace

int VelocityTable::forDynamic(score::Dynamic d) const {
    switch (d) {
    case score::Dynamic::PP: return values[0];
    case score::Dynamic::P: return values[1];
    case score::Dynamic::MP: return values[2];
    case score::Dynamic::None:
    case score::Dynamic::MF: return values[3];
    case score::Dynamic::F: return values[4];
    case score::Dynamic::FF: return values[5];
    }
    return values[3];
}

bool VelocityTable::isMonotonic() const {
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < 1 || values[i] > 127) return false;
        if (i > 0 && values[i] <= values[i - 1]) return false;
    }
    return true;
}

EventSequencer::EventSequencer(const SequencerPolicy& policy) {
    setPolicy(policy);
}

void EventSequencer::setPolicy(const SequencerPolicy& policy) {
    m_policy = policy;
    m_policy.staccatoFraction = qBound(0.05, m_policy.staccatoFraction, 1.0);
    if (!m_policy.velocities.isMonotonic()) {
        qWarning() << "EventSequencer: velocity table is not monotonic, using defaults";
        m_policy.velocities = VelocityTable{};
    }
}

int EventSequencer::mapPitch(int pitch, const RangeDecision& decision) {
    int p = pitch + decision.octaveShift;
    const score::PitchRange& t = decision.target;
    if (!t.isValid()) return p;
    if (p < t.lowest) p += 12 * ((t.lowest - p + 11) / 12);
    else if (p > t.highest) p -= 12 * ((p - t.highest + 11) / 12);
    return p;
}

bool EventSequencer::sequence(const score::Score& score,
                              const RangeDecision& decision,
                              Timeline& out,
                              PlaybackError* err) const {
    out = Timeline{};
    out.title = score.title;
    out.sourcePath = score.sourcePath;
    out.decision = decision;

    quint32 nextId = 0;
    int dropped = 0;
    for (int voiceIndex : decision.voices) {
        if (voiceIndex < 0 || voiceIndex >= score.voices.size()) continue;

        const QVector<SoundingNote> sounding =
            mergeVoice(score.voices[voiceIndex], voiceIndex, m_policy.velocities);

        for (const auto& s : sounding) {
            const int pitch = mapPitch(s.pitch, decision);
            if (pitch < 0 || pitch > 127 || (decision.target.isValid() && !decision.target.contains(pitch))) {
                ++dropped;
                continue;
            }

            const double onSec = score.tempo.secondsAt(s.startBeat);
            double gate = score.tempo.secondsAt(s.endBeat) - onSec;
            if (s.staccato) gate *= m_policy.staccatoFraction;
            if (gate <= 0.0) continue;

            const quint32 id = ++nextId;

            TimelineEvent on;
            on.timeSec = onSec;
            on.kind = TimelineEvent::Kind::NoteOn;
            on.pitch = pitch;
            on.velocity = s.velocity;
            on.gateSec = gate;
            on.voice = voiceIndex;
            on.noteId = id;
            out.events.push_back(on);

            TimelineEvent off = on;
            off.timeSec = onSec + gate;
            off.kind = TimelineEvent::Kind::NoteOff;
            off.velocity = 0;
            out.events.push_back(off);

            out.durationSec = std::max(out.durationSec, off.timeSec);
        }
    }

    if (dropped > 0) {
        qWarning().noquote() << QString("EventSequencer: dropped %1 note(s) outside %2")
                                    .arg(dropped)
                                    .arg(decision.target.toString());
    }

    if (out.events.isEmpty()) {
        return fail(err, ErrorKind::EmptyTimeline,
                    QString("'%1' has no playable notes in %2 mode")
                        .arg(score.title.isEmpty() ? score.sourcePath : score.title,
                             playbackModeName(decision.mode)));
    }

    std::stable_sort(out.events.begin(), out.events.end(), eventLess);
    return true;
}

} // namespace pianoplayer::engine

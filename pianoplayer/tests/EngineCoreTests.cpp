#include "pianoplayer/backend/KeySimulationBackend.h"
#include "pianoplayer/backend/MidiBackend.h"
#include "pianoplayer/backend/SampleBackend.h"
#include "pianoplayer/engine/EventSequencer.h"
#include "pianoplayer/engine/RangeAnalyzer.h"
#include "pianoplayer/input/HotkeySource.h"
#include "pianoplayer/score/MusicXmlScoreSource.h"
#include "pianoplayer/score/PitchNames.h"
#include "pianoplayer/score/ScoreLibrary.h"
#include "pianoplayer/tests/TestFakes.h"
#include "ConfigLoader.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QSet>
#include <QTemporaryDir>
#include <QtGlobal>

#include <cmath>

using pianoplayer::backend::KeyModifier;
using pianoplayer::backend::KeySimulationBackend;
using pianoplayer::backend::KeyStroke;
using pianoplayer::engine::ErrorKind;
using pianoplayer::engine::EventSequencer;
using pianoplayer::engine::PlaybackError;
using pianoplayer::engine::PlaybackMode;
using pianoplayer::engine::RangeAnalyzer;
using pianoplayer::engine::RangeDecision;
using pianoplayer::engine::Timeline;
using pianoplayer::engine::TimelineEvent;
using pianoplayer::score::Dynamic;
using pianoplayer::score::PitchRange;
using pianoplayer::score::Score;
using pianoplayer::score::ScoreLibrary;
using pianoplayer::score::SelectionMode;
using pianoplayer::tests::makeScore;
using pianoplayer::tests::note;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectNear(double a, double b, const QString& msg) {
    expect(std::abs(a - b) < 1e-9, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static const PitchRange kKeysRange{48, 83};

static QVector<const TimelineEvent*> noteOns(const Timeline& t) {
    QVector<const TimelineEvent*> out;
    for (const auto& e : t.events) {
        if (e.kind == TimelineEvent::Kind::NoteOn) out.push_back(&e);
    }
    return out;
}

static bool sequenceScore(const Score& s, int tolerance, Timeline& out, PlaybackError* err = nullptr) {
    RangeDecision d;
    if (!RangeAnalyzer(tolerance).analyze(s, kKeysRange, d, err)) return false;
    return EventSequencer().sequence(s, d, out, err);
}

} // namespace

static void testPitchNamesAndRanges() {
    expectStrEq(pianoplayer::score::noteName(60), "C4", "60 is C4");
    expectStrEq(pianoplayer::score::noteName(61, true), "Db4", "61 spelled flat");
    expectStrEq(pianoplayer::score::noteName(48), "C3", "48 is C3");

    int midi = -1;
    expect(pianoplayer::score::parseNoteName("Bb3", midi), "Bb3 parses");
    expectEq(midi, 58, "Bb3 pitch");
    expect(pianoplayer::score::parseNoteName("G#6", midi), "G#6 parses");
    expectEq(midi, 92, "G#6 pitch");
    expect(!pianoplayer::score::parseNoteName("H2", midi), "H2 rejected");

    expectStrEq(kKeysRange.toString(), "C3-B5 (48-83)", "range text");
    expectStrEq(PitchRange{}.toString(), "empty", "empty range text");
    expect(!PitchRange{}.isValid(), "default range is invalid");
    expect(kKeysRange.widened(2).contains(PitchRange{46, 85}), "widened range");
}

static void testTempoMap() {
    pianoplayer::score::TempoMap m;
    expectNear(m.secondsAt(4.0), 2.0, "default 120 bpm: 4 beats = 2 s");

    m.addChange(2.0, 60.0);
    expectNear(m.secondsAt(2.0), 1.0, "before the change");
    expectNear(m.secondsAt(4.0), 3.0, "two beats at 60 bpm after two at 120");
    expectNear(m.bpmAt(0.0), 120.0, "default before first change");
    expectNear(m.bpmAt(3.0), 60.0, "after change");

    m.addChange(1.0, -5.0);
    expectEq(m.changes().size(), 1, "non-positive tempo ignored");
    m.addChange(2.0, 90.0);
    expectEq(m.changes().size(), 1, "same beat replaces");
    expectNear(m.bpmAt(2.0), 90.0, "replaced tempo");
}

static void testFullEnsembleWhenRangeFits() {
    const Score s = makeScore("fits", {{48, 60, 72}, {83, 55}});
    RangeDecision d;
    PlaybackError err;
    expect(RangeAnalyzer(0).analyze(s, kKeysRange, d, &err), "C3-B5 score analyzes");
    expect(d.mode == PlaybackMode::FullEnsemble, "FullEnsemble");
    expectEq(d.octaveShift, 0, "no shift");
    expectEq(d.voices.size(), 2, "all voices");

    Timeline t;
    expect(EventSequencer().sequence(s, d, t, &err), "sequences");
    expectEq(t.events.size(), 10, "five NoteOn/NoteOff pairs");
    QSet<int> pitches;
    for (const auto* on : noteOns(t)) {
        expectEq(on->velocity, 80, "no dynamics -> mf velocity");
        pitches.insert(on->pitch);
    }
    expect(pitches == QSet<int>({48, 60, 72, 83, 55}), "pitches untouched");
    expectStrEq(d.describe(), "Full Score", "describe full");
}

static void testMelodyOnlyShift() {
    // Melody C2-C4 against C3-B5 needs one octave up; the upper voice makes the full score too wide.
    const Score s = makeScore("low melody", {{36, 48, 60}, {90}});
    RangeDecision d;
    expect(RangeAnalyzer(0).analyze(s, kKeysRange, d), "analyzes");
    expect(d.mode == PlaybackMode::MelodyOnly, "MelodyOnly");
    expectEq(d.octaveShift, 12, "shift +12");
    expect(d.voices == QVector<int>({0}), "only the melody voice");
    expectStrEq(d.describe(), "Melody Only+Transposed(+12)", "describe melody");

    Timeline t;
    expect(EventSequencer().sequence(s, d, t), "sequences");
    const auto ons = noteOns(t);
    expectEq(ons.size(), 3, "three melody notes");
    if (ons.size() == 3) {
        expectEq(ons[0]->pitch, 48, "C2 -> C3");
        expectEq(ons[2]->pitch, 72, "C4 -> C5");
    }

    int shift = 0;
    expect(RangeAnalyzer::minimalOctaveShift({84, 96}, kKeysRange, shift), "high melody placeable");
    expectEq(shift, -24, "smallest downward shift");
    expect(RangeAnalyzer::minimalOctaveShift({30, 40}, kKeysRange, shift), "low melody placeable");
    expectEq(shift, 24, "smallest upward shift");
    expect(RangeAnalyzer::minimalOctaveShift({50, 60}, kKeysRange, shift), "inside already");
    expectEq(shift, 0, "no shift when inside");
}

static void testUnplayableScore() {
    const Score s = makeScore("too wide", {{30, 80}});
    RangeDecision d;
    PlaybackError err;
    expect(!RangeAnalyzer(0).analyze(s, kKeysRange, d, &err), "melody wider than the keyboard fails");
    expect(err.kind == ErrorKind::UnplayableScore, "UnplayableScore kind");
    expect(err.message.contains("(30-80)"), "message names the offending range");
}

static void testToleranceFolding() {
    const Score s = makeScore("overhang", {{46, 60, 83}});
    RangeDecision d;
    expect(RangeAnalyzer(2).analyze(s, kKeysRange, d), "fits with tolerance 2");
    expect(d.mode == PlaybackMode::FullEnsemble, "FullEnsemble with tolerance");

    Timeline t;
    expect(EventSequencer().sequence(s, d, t), "sequences");
    QSet<int> pitches;
    for (const auto* on : noteOns(t)) pitches.insert(on->pitch);
    expect(pitches == QSet<int>({58, 60, 83}), "A#2 folded up one octave into range");
    expect(!RangeAnalyzer(1).analyze(s, kKeysRange, d), "does not fit with tolerance 1");
}

static void testSequencingIsDeterministic() {
    Score s = makeScore("repeat", {{60, 62, 64, 65}, {48, 52}});
    s.voices[0].notes[1].staccato = true;
    s.voices[0].notes[2].dynamic = Dynamic::FF;
    s.tempo.addChange(2.0, 90.0);

    Timeline a;
    Timeline b;
    expect(sequenceScore(s, 0, a), "first pass");
    expect(sequenceScore(s, 0, b), "second pass");
    expect(a.events == b.events, "identical events");
    expectNear(a.durationSec, b.durationSec, "identical duration");
}

static void testTiesMerge() {
    Score s;
    s.title = "ties";
    pianoplayer::score::Voice v;
    auto first = note(60, 0, 1);
    first.tiedToNext = true;
    auto second = note(60, 1, 1);
    second.tiedFromPrevious = true;
    v.notes = {first, second, note(62, 2, 1)};
    auto dangling = note(64, 3, 1);
    dangling.tiedToNext = true;
    v.notes.push_back(dangling);
    s.voices.push_back(v);

    Timeline t;
    expect(sequenceScore(s, 0, t), "sequences");
    expectEq(t.events.size(), 6, "tied pair collapses to one NoteOn/NoteOff");
    if (t.events.size() != 6) return;

    expect(t.events[0].kind == TimelineEvent::Kind::NoteOn && t.events[0].pitch == 60, "C4 on");
    expectNear(t.events[0].gateSec, 1.0, "gate covers both tied beats");
    expect(t.events[1].kind == TimelineEvent::Kind::NoteOff && t.events[1].pitch == 60, "C4 off first at 1.0 s");
    expectNear(t.events[1].timeSec, 1.0, "C4 off time");
    expect(t.events[2].kind == TimelineEvent::Kind::NoteOn && t.events[2].pitch == 62, "D4 on after the off");
    expectNear(t.events[5].timeSec, 2.0, "dangling tie ends with its own note");
}

static void testTiedChainMerges() {
    // G4 tied across four quarters (start, continue, continue, stop), then a fresh G4.
    const QByteArray doc = R"(<?xml version="1.0" encoding="UTF-8"?>
<score-partwise version="3.1">
  <part-list><score-part id="P1"><part-name>Melody</part-name></score-part></part-list>
  <part id="P1">
    <measure number="1">
      <attributes><divisions>1</divisions></attributes>
      <note><pitch><step>G</step><octave>4</octave></pitch><duration>1</duration>
        <tie type="start"/><notations><tied type="start"/></notations></note>
      <note><pitch><step>G</step><octave>4</octave></pitch><duration>1</duration>
        <notations><tied type="continue"/></notations></note>
      <note><pitch><step>G</step><octave>4</octave></pitch><duration>1</duration>
        <notations><tied type="continue"/></notations></note>
      <note><pitch><step>G</step><octave>4</octave></pitch><duration>1</duration>
        <tie type="stop"/><notations><tied type="stop"/><articulations><staccato/></articulations></notations></note>
    </measure>
    <measure number="2">
      <note><pitch><step>G</step><octave>4</octave></pitch><duration>1</duration></note>
    </measure>
  </part>
</score-partwise>
)";

    pianoplayer::score::MusicXmlScoreSource source;
    Score s;
    PlaybackError err;
    expect(source.parse(doc, "chain.musicxml", s, &err), "chain parses: " + err.message);
    if (s.voices.size() != 1 || s.voices[0].notes.size() != 5) {
        expect(false, "chain score has five notes in one voice");
        return;
    }
    const auto& n = s.voices[0].notes;
    expect(n[1].tiedFromPrevious && n[1].tiedToNext, "continue links both ways");
    expect(n[2].tiedFromPrevious && n[2].tiedToNext, "second continue links both ways");
    expect(n[3].tiedFromPrevious && !n[3].tiedToNext, "stop ends the chain");

    Timeline t;
    expect(sequenceScore(s, 0, t), "chain sequences");
    expectEq(t.events.size(), 4, "four tied notes make one pair, plus the fresh note");
    if (t.events.size() != 4) return;

    expect(t.events[0].kind == TimelineEvent::Kind::NoteOn && t.events[0].pitch == 67, "chain NoteOn");
    expectNear(t.events[0].timeSec, 0.0, "chain starts on the first note");
    // Four beats at 120 bpm, halved by the staccato on the last note of the chain.
    expectNear(t.events[0].gateSec, 1.0, "last note's staccato shortens the whole chain");
    expect(t.events[1].kind == TimelineEvent::Kind::NoteOff && t.events[1].noteId == t.events[0].noteId,
           "chain NoteOff pairs with its NoteOn");
    expectNear(t.events[2].timeSec, 2.0, "fresh attack after the chain keeps its onset");
    expect(t.events[2].noteId != t.events[0].noteId, "fresh attack is a new note");
    expectNear(t.events[3].timeSec, 2.5, "fresh note ends after one beat");
}

static void testStaccatoOnlyMovesNoteOff() {
    Score s;
    pianoplayer::score::Voice v;
    auto shortNote = note(60, 0, 1);
    shortNote.staccato = true;
    v.notes = {shortNote, note(62, 1, 1)};
    s.voices.push_back(v);

    Timeline t;
    expect(sequenceScore(s, 0, t), "sequences");
    expectEq(t.events.size(), 4, "two pairs");
    if (t.events.size() != 4) return;
    expectNear(t.events[0].timeSec, 0.0, "staccato onset unchanged");
    expectNear(t.events[1].timeSec, 0.25, "staccato NoteOff at half the notated length");
    expectNear(t.events[2].timeSec, 0.5, "next onset unchanged");
    expectNear(t.events[3].timeSec, 1.0, "legato NoteOff at full length");

    // Tied chain: the last note's articulation applies.
    Score tied;
    pianoplayer::score::Voice tv;
    auto head = note(64, 0, 1);
    head.tiedToNext = true;
    auto tail = note(64, 1, 1);
    tail.tiedFromPrevious = true;
    tail.staccato = true;
    tv.notes = {head, tail};
    tied.voices.push_back(tv);
    Timeline tt;
    expect(sequenceScore(tied, 0, tt), "tied staccato sequences");
    if (!tt.events.isEmpty()) expectNear(tt.events[0].gateSec, 0.5, "tied chain shortened by its last note");
}

static void testDynamicsInheritance() {
    Score s;
    pianoplayer::score::Voice melody;
    melody.notes = {note(60, 0, 1, Dynamic::F), note(62, 1, 1), note(64, 2, 1, Dynamic::P)};
    pianoplayer::score::Voice bass;
    bass.notes = {note(55, 0, 3)};
    s.voices = {melody, bass};

    Timeline t;
    expect(sequenceScore(s, 0, t), "sequences");
    QHash<int, int> velocity;
    for (const auto* on : noteOns(t)) velocity.insert(on->pitch, on->velocity);
    expectEq(velocity.value(60), 96, "f");
    expectEq(velocity.value(62), 96, "inherits f");
    expectEq(velocity.value(64), 49, "p");
    expectEq(velocity.value(55), 80, "other voice starts at mf");
}

static void testEqualTimesPutNoteOffFirst() {
    const Score s = makeScore("repeated", {{60, 60}});
    Timeline t;
    expect(sequenceScore(s, 0, t), "sequences");
    expectEq(t.events.size(), 4, "two pairs");
    if (t.events.size() != 4) return;
    expectNear(t.events[1].timeSec, 0.5, "first off at 0.5");
    expectNear(t.events[2].timeSec, 0.5, "second on at 0.5");
    expect(t.events[1].kind == TimelineEvent::Kind::NoteOff, "NoteOff precedes");
    expect(t.events[2].kind == TimelineEvent::Kind::NoteOn, "NoteOn follows");
    expect(t.events[0].noteId == t.events[1].noteId, "pair shares its id");
    expect(t.events[2].noteId != t.events[0].noteId, "new note, new id");
}

static void testEmptyTimeline() {
    Score empty;
    empty.voices.push_back(pianoplayer::score::Voice{});
    Timeline t;
    PlaybackError err;
    expect(!sequenceScore(empty, 0, t, &err), "no notes cannot be sequenced");
    expect(err.kind == ErrorKind::EmptyTimeline, "EmptyTimeline kind");

    // Silent melody with an out-of-range accompaniment.
    Score silentMelody = makeScore("silent", {{}, {20, 100}});
    err.clear();
    expect(!sequenceScore(silentMelody, 0, t, &err), "silent melody cannot be sequenced");
    expect(err.kind == ErrorKind::EmptyTimeline, "EmptyTimeline for silent melody");
}

static void testSequencerPolicy() {
    pianoplayer::engine::VelocityTable table;
    expect(table.isMonotonic(), "default table is monotonic");
    expectEq(table.forDynamic(Dynamic::PP), 33, "pp");
    expectEq(table.forDynamic(Dynamic::FF), 112, "ff");

    pianoplayer::engine::SequencerPolicy bad;
    bad.velocities.values = {{40, 30, 64, 80, 96, 112}};
    bad.staccatoFraction = 0.0;
    const EventSequencer seq(bad);
    expectEq(seq.policy().velocities.values[0], 33, "non-monotonic table replaced by defaults");
    expectNear(seq.policy().staccatoFraction, 0.05, "staccato fraction clamped");
}

static void testScoreLibrarySequential() {
    ScoreLibrary lib(SelectionMode::Sequential);
    lib.setScores({"a", "b", "c"});
    expectEq(lib.takeForStart(), 0, "first start plays the first score");
    expectEq(lib.advance(), 1, "then b");
    expectEq(lib.advance(), 2, "then c");
    expectEq(lib.advance(), 0, "wraps to a");

    ScoreLibrary back(SelectionMode::Sequential);
    back.setScores({"a", "b", "c"});
    expectEq(back.selectPrevious(), 2, "previous from nothing selects the last");
    expect(back.hasExplicitSelection(), "explicit pointer set");
    expectEq(back.takeForStart(), 2, "start plays the selected score");
    expect(!back.hasExplicitSelection(), "pointer consumed");
    expectEq(back.advance(), 0, "sequential continues after it");
    expectEq(back.selectNext(), 1, "next moves the pointer");

    ScoreLibrary none(SelectionMode::Sequential);
    expectEq(none.takeForStart(), -1, "empty library");
    expectEq(none.selectNext(), -1, "empty library has nothing to select");
}

static void testScoreLibraryRandom() {
    ScoreLibrary lib(SelectionMode::Random);
    lib.setSeed(42);
    lib.setScores({"a", "b", "c", "d", "e"});

    int last = -1;
    for (int round = 0; round < 40; ++round) {
        QSet<int> seen;
        for (int i = 0; i < 5; ++i) {
            const int idx = lib.advance();
            if (i == 0 && last >= 0) expect(idx != last, "no repeat across the reshuffle boundary");
            seen.insert(idx);
            last = idx;
        }
        expectEq(seen.size(), 5, "each round plays every score once");
    }

    ScoreLibrary picked(SelectionMode::Random);
    picked.setSeed(7);
    picked.setScores({"a", "b", "c", "d"});
    const int chosen = picked.selectNext();
    expectEq(picked.takeForStart(), chosen, "explicit pick wins in random mode");
    QSet<int> rest;
    for (int i = 0; i < 3; ++i) rest.insert(picked.advance());
    expect(!rest.contains(chosen), "explicit pick counts as drawn");
    expectEq(rest.size(), 3, "remaining scores drawn once");

    ScoreLibrary single(SelectionMode::Random);
    single.setScores({"only"});
    expectEq(single.advance(), 0, "single score");
    expectEq(single.advance(), 0, "single score repeats");
}

static void testScoreScan() {
    QTemporaryDir tmp;
    expect(tmp.isValid(), "temp dir");
    for (const char* name : {"b.musicxml", "A.xml", "c.mxl", "notes.txt"}) {
        QFile f(QDir(tmp.path()).filePath(name));
        expect(f.open(QIODevice::WriteOnly), QString("create %1").arg(name));
        f.write("<score-partwise/>");
    }
    const QStringList found = ScoreLibrary::scan(tmp.path());
    expectEq(found.size(), 3, "only score files");
    if (found.size() == 3) {
        expect(found[0].endsWith("A.xml"), "sorted by name");
        expect(found[1].endsWith("b.musicxml"), "sorted by name");
        expect(found[2].endsWith("c.mxl"), "compressed files are listed");
    }

    const QString missing = QDir(tmp.path()).filePath("scores/new");
    expect(ScoreLibrary::scan(missing).isEmpty(), "missing directory is empty");
    expect(QDir(missing).exists(), "missing directory is created");
}

static void testMusicXmlParsing() {
    const QByteArray doc = R"(<?xml version="1.0" encoding="UTF-8"?>
<score-partwise version="3.1">
  <work><work-title>Test Piece</work-title></work>
  <part-list>
    <score-part id="P1"><part-name>Flute</part-name></score-part>
    <score-part id="P2"><part-name>Piano</part-name></score-part>
  </part-list>
  <part id="P1">
    <measure number="1">
      <attributes><divisions>2</divisions></attributes>
      <direction><direction-type><dynamics><f/></dynamics></direction-type><sound tempo="90"/></direction>
      <note><pitch><step>C</step><octave>4</octave></pitch><duration>2</duration><tie type="start"/></note>
      <note><pitch><step>C</step><octave>4</octave></pitch><duration>2</duration><tie type="stop"/></note>
      <note><rest/><duration>1</duration></note>
      <note><pitch><step>F</step><alter>1</alter><octave>4</octave></pitch><duration>1</duration>
        <notations><articulations><staccato/></articulations></notations></note>
      <note><grace/><pitch><step>G</step><octave>4</octave></pitch></note>
      <note><pitch><step>E</step><octave>4</octave></pitch><duration>2</duration></note>
      <note><chord/><pitch><step>G</step><octave>4</octave></pitch><duration>2</duration></note>
    </measure>
  </part>
  <part id="P2">
    <measure number="1">
      <attributes><divisions>1</divisions></attributes>
      <note><pitch><step>C</step><octave>3</octave></pitch><duration>4</duration></note>
      <backup><duration>4</duration></backup>
      <note><pitch><step>B</step><alter>-1</alter><octave>2</octave></pitch><duration>2</duration></note>
    </measure>
  </part>
</score-partwise>
)";

    pianoplayer::score::MusicXmlScoreSource source;
    Score s;
    PlaybackError err;
    expect(source.parse(doc, "test.musicxml", s, &err), "document parses: " + err.message);
    expectStrEq(s.title, "Test Piece", "work title");
    expectEq(s.voices.size(), 2, "one voice per part");
    if (s.voices.size() != 2) return;

    expectStrEq(s.voices[0].name, "Flute", "part name");
    const auto& n = s.voices[0].notes;
    expectEq(n.size(), 5, "grace note and rest skipped");
    if (n.size() == 5) {
        expectEq(n[0].pitch, 60, "C4");
        expect(n[0].tiedToNext && n[1].tiedFromPrevious, "tie flags");
        expect(n[0].dynamic == Dynamic::F, "dynamic attached to the next note");
        expectEq(n[2].pitch, 66, "F#4");
        expect(n[2].staccato, "staccato");
        expectNear(n[2].onsetBeat, 2.5, "rest advances the cursor");
        expectNear(n[2].durationBeats, 0.5, "divisions respected");
        expectNear(n[3].onsetBeat, 3.0, "E4 onset");
        expectNear(n[4].onsetBeat, 3.0, "chord note shares the onset");
        expectEq(n[4].pitch, 67, "G4");
    }
    expectNear(s.tempo.bpmAt(0.0), 90.0, "sound tempo");

    const auto& lower = s.voices[1].notes;
    expectEq(lower.size(), 2, "backup voice notes");
    if (lower.size() == 2) {
        expectNear(lower[1].onsetBeat, 0.0, "backup rewinds");
        expectEq(lower[1].pitch, 46, "Bb2");
    }

    Score untitled;
    expect(source.parse("<score-partwise><part id=\"P1\"/></score-partwise>", "dir/My Song.musicxml", untitled),
           "minimal document");
    expectStrEq(untitled.title, "My Song", "title falls back to the file name");
}

static void testMusicXmlErrors() {
    pianoplayer::score::MusicXmlScoreSource source;
    Score s;
    PlaybackError err;

    expect(!source.load("/nonexistent/archive.mxl", s, &err), "mxl rejected");
    expect(err.kind == ErrorKind::Parse, "mxl is a parse error");

    err.clear();
    expect(!source.parse(QByteArray("PK\x03\x04zipdata", 11), "x.musicxml", s, &err), "zip payload rejected");
    expect(err.kind == ErrorKind::Parse, "zip payload is a parse error");

    err.clear();
    expect(!source.parse("<score-timewise/>", "x.musicxml", s, &err), "timewise rejected");
    expect(err.kind == ErrorKind::Parse, "unsupported root is a parse error");

    err.clear();
    expect(!source.parse("<score-partwise><part>", "x.musicxml", s, &err), "truncated document rejected");
    expect(err.kind == ErrorKind::Parse, "truncated document is a parse error");

    err.clear();
    expect(!source.load("/nonexistent/missing.musicxml", s, &err), "missing file rejected");
    expect(err.kind == ErrorKind::Parse, "missing file is a parse error");
}

static void testKeyTable() {
    KeyStroke k;
    expect(KeySimulationBackend::keyForPitch(48, false, k) && k == KeyStroke{'z', KeyModifier::None}, "C3 -> z");
    expect(KeySimulationBackend::keyForPitch(60, false, k) && k == KeyStroke{'a', KeyModifier::None}, "C4 -> a");
    expect(KeySimulationBackend::keyForPitch(83, false, k) && k == KeyStroke{'u', KeyModifier::None}, "B5 -> u");
    expect(KeySimulationBackend::keyForPitch(49, false, k) && k == KeyStroke{'z', KeyModifier::Shift}, "C#3 -> Shift+z");
    expect(KeySimulationBackend::keyForPitch(49, true, k) && k == KeyStroke{'x', KeyModifier::Control}, "Db3 -> Ctrl+x");
    expect(KeySimulationBackend::keyForPitch(82, false, k) && k == KeyStroke{'y', KeyModifier::Shift}, "A#5 -> Shift+y");
    expect(KeySimulationBackend::keyForPitch(82, true, k) && k == KeyStroke{'u', KeyModifier::Control}, "Bb5 -> Ctrl+u");
    expect(!KeySimulationBackend::keyForPitch(47, false, k), "below C3 has no key");
    expect(!KeySimulationBackend::keyForPitch(84, false, k), "above B5 has no key");

    QVector<KeyStroke> taps;
    KeySimulationBackend keys(std::make_unique<pianoplayer::tests::FakeKeyInjector>(&taps));
    QString why;
    expect(!keys.noteOn(60, 80, &why), "closed backend refuses notes");
    expect(keys.open(&why), "opens with a working injector");
    expect(keys.noteOn(66, 100, &why), "F#4 plays");
    expect(keys.noteOff(66, &why), "NoteOff accepted");
    expectEq(taps.size(), 1, "NoteOff does not type anything");
    if (!taps.isEmpty()) expect(taps[0] == KeyStroke{'f', KeyModifier::Shift}, "F#4 -> Shift+f");
    expect(!keys.noteOn(40, 80, &why), "out-of-range pitch reported");
    expect(!keys.supportsVelocity() && !keys.supportsSustain(), "key capabilities");
    expect(keys.supportedRange() == kKeysRange, "key range");

    KeySimulationBackend broken(std::make_unique<pianoplayer::tests::FakeKeyInjector>(&taps, false));
    expect(!broken.open(&why), "open fails without a display");
    expect(why.contains("no display"), "reason propagated");
}

static void testBackendTables() {
    using pianoplayer::backend::SampleBackend;
    expectStrEq(SampleBackend::sampleFileForPitch(60), "a84.mp3", "C4 sample");
    expectStrEq(SampleBackend::sampleFileForPitch(36), "a49.mp3", "C2 sample");
    expectStrEq(SampleBackend::sampleFileForPitch(92), "b86.mp3", "G#6 sample");
    expect(SampleBackend::sampleFileForPitch(46).isEmpty(), "A#2 has no sample");
    expect(SampleBackend::sampleFileForPitch(93).isEmpty(), "above the sample range");
    expect(SampleBackend::sampleFileForPitch(96).isEmpty(), "C7 is outside the sample range");

    using pianoplayer::backend::MidiBackend;
    const QStringList ports = {"Midi Through Port-0", "FLUID Synth (1234)"};
    expectEq(MidiBackend::choosePort(ports, "fluid"), 1, "case-insensitive substring");
    expectEq(MidiBackend::choosePort(ports, "loopMIDI"), 0, "no match -> first port");
    expectEq(MidiBackend::choosePort(ports, QString()), 0, "no name -> first port");
    expectEq(MidiBackend::choosePort({}, "fluid"), -1, "no ports -> virtual");

    pianoplayer::backend::BackendKind kind;
    expect(pianoplayer::backend::parseBackendKind("MIDI", kind) && kind == pianoplayer::backend::BackendKind::Midi,
           "midi parses");
    expect(pianoplayer::backend::parseBackendKind("pynput", kind) &&
               kind == pianoplayer::backend::BackendKind::KeySimulation,
           "pynput alias");
    expect(!pianoplayer::backend::parseBackendKind("speaker", kind), "unknown backend");
}

static void testHotkeyBindings() {
    using pianoplayer::engine::ControlEvent;
    ControlEvent e;
    expectEq(pianoplayer::input::defaultHotkeyBindings().size(), 6, "six hotkeys");
    expect(pianoplayer::input::controlEventForKey("F7", e) && e == ControlEvent::SelectPrevious, "F7");
    expect(pianoplayer::input::controlEventForKey("F8", e) && e == ControlEvent::SelectNext, "F8");
    expect(pianoplayer::input::controlEventForKey("f9", e) && e == ControlEvent::StartOrResume, "F9");
    expect(pianoplayer::input::controlEventForKey("F10", e) && e == ControlEvent::Stop, "F10");
    expect(pianoplayer::input::controlEventForKey("F11", e) && e == ControlEvent::PauseToggle, "F11");
    expect(pianoplayer::input::controlEventForKey("Escape", e) && e == ControlEvent::Quit, "Escape");
    expect(!pianoplayer::input::controlEventForKey("F12", e), "F12 unbound");
}

static void testConfigLoader() {
    ConfigLoader loader;
    const PlayerConfig cfg = loader.loadConfigData(R"(<PianoPlayerConfig name="test">
  <Settings>
    <Mode>sequential</Mode>
    <Tolerance>3</Tolerance>
    <AutoAdvanceDelayMs>1500</AutoAdvanceDelayMs>
    <Backend>midi</Backend>
    <MidiPort>fluid</MidiPort>
    <MidiChannel>20</MidiChannel>
    <PreferFlats>true</PreferFlats>
  </Settings>
  <Velocities>
    <Velocity dynamic="mf" value="10"/>
  </Velocities>
</PianoPlayerConfig>)");
    expect(cfg.isValid, "config parses");
    expectStrEq(cfg.name, "test", "name attribute");
    expect(cfg.mode == SelectionMode::Sequential, "mode");
    expectEq(cfg.tolerance, 3, "tolerance");
    expectEq(cfg.autoAdvanceDelayMs, 1500, "delay");
    expect(cfg.backend == pianoplayer::backend::BackendKind::Midi, "backend");
    expectStrEq(cfg.backendSettings.midiPortName, "fluid", "port");
    expectEq(cfg.backendSettings.midiChannel, 1, "invalid channel replaced");
    expect(cfg.backendSettings.preferFlats, "flat spelling");
    expectEq(cfg.velocities.values[3], 80, "non-monotonic velocities replaced");
    expectNear(cfg.staccatoFraction, 0.5, "default staccato fraction");

    expect(!loader.loadConfigData("<SomethingElse/>").isValid, "wrong root rejected");
    expect(!loader.loadConfigData("<PianoPlayerConfig><Settings>").isValid, "broken XML rejected");
    expectEq(loader.loadConfigData("<PianoPlayerConfig><Settings><Tolerance>-4</Tolerance></Settings></PianoPlayerConfig>")
                 .tolerance,
             0, "negative tolerance replaced");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    testPitchNamesAndRanges();
    testTempoMap();
    testFullEnsembleWhenRangeFits();
    testMelodyOnlyShift();
    testUnplayableScore();
    testToleranceFolding();
    testSequencingIsDeterministic();
    testTiesMerge();
    testTiedChainMerges();
    testStaccatoOnlyMovesNoteOff();
    testDynamicsInheritance();
    testEqualTimesPutNoteOffFirst();
    testEmptyTimeline();
    testSequencerPolicy();
    testScoreLibrarySequential();
    testScoreLibraryRandom();
    testScoreScan();
    testMusicXmlParsing();
    testMusicXmlErrors();
    testKeyTable();
    testBackendTables();
    testHotkeyBindings();
    testConfigLoader();
    if (g_failures > 0) {
        qWarning() << "EngineCoreTests failures:" << g_failures;
        return 1;
    }
    qInfo() << "EngineCoreTests OK";
    return 0;
}

#pragma once

#include <QString>

namespace pianoplayer::score {

// Normalized pitch class: 0=C, 1=C#/Db, ... 11=B.
inline int normalizePc(int pc) {
    pc %= 12;
    if (pc < 0) pc += 12;
    return pc;
}

// MIDI octave convention used throughout: 60 = C4, 48 = C3.
inline int octaveOf(int midi) { return midi / 12 - 1; }

// True for C#, D#, F#, G#, A#.
bool isBlackKey(int midi);

// Spells a pitch class using either flats or sharps ("Eb" / "D#").
QString spellPitchClass(int pc, bool preferFlats);

// "C4", "F#5", or "Gb5" with preferFlats.
QString noteName(int midi, bool preferFlats = false);

// Parses a step/alter/octave triple as found in MusicXML into a MIDI number.
// Returns false if the step letter is unknown or the result leaves 0..127.
bool pitchFromStep(QChar step, int alter, int octave, int& midiOut);

// Parses "C4", "A#3", "Bb2" (also accepts ♭/♯). Returns false on malformed input.
bool parseNoteName(QString token, int& midiOut);

} // namespace pianoplayer::score

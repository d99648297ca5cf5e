#include "pianoplayer/score/PitchNames.h"

#include <QChar>

namespace pianoplayer::score {
namespace {

static int letterToPc(QChar letter) {
    switch (letter.toUpper().unicode()) {
    case 'C': return 0;
    case 'D': return 2;
    case 'E': return 4;
    case 'F': return 5;
    case 'G': return 7;
    case 'A': return 9;
    case 'B': return 11;
    default:  return -1;
    }
}

} // namespace

bool isBlackKey(int midi) {
    switch (normalizePc(midi)) {
    case 1: case 3: case 6: case 8: case 10: return true;
    default: return false;
    }
}

QString spellPitchClass(int pc, bool preferFlats) {
    pc = normalizePc(pc);
    static const char* kSharps[12] = {"C","C#","D","D#","E","F","F#","G","G#","A","A#","B"};
    static const char* kFlats[12]  = {"C","Db","D","Eb","E","F","Gb","G","Ab","A","Bb","B"};
    return preferFlats ? QString::fromLatin1(kFlats[pc]) : QString::fromLatin1(kSharps[pc]);
}

QString noteName(int midi, bool preferFlats) {
    return spellPitchClass(midi, preferFlats) + QString::number(octaveOf(midi));
}

bool pitchFromStep(QChar step, int alter, int octave, int& midiOut) {
    const int base = letterToPc(step);
    if (base < 0) return false;
    const int midi = (octave + 1) * 12 + base + alter;
    if (midi < 0 || midi > 127) return false;
    midiOut = midi;
    return true;
}

bool parseNoteName(QString token, int& midiOut) {
    token = token.trimmed();
    if (token.size() < 2) return false;

    token.replace(QChar(0x266D), 'b'); // ♭
    token.replace(QChar(0x266F), '#'); // ♯

    int alter = 0;
    int i = 1;
    for (; i < token.size(); ++i) {
        const QChar c = token[i];
        if (c == 'b') alter -= 1;
        else if (c == '#') alter += 1;
        else break;
    }

    bool ok = false;
    const int octave = token.mid(i).toInt(&ok);
    if (!ok) return false;
    return pitchFromStep(token[0], alter, octave, midiOut);
}

} // namespace pianoplayer::score

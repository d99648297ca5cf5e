#include "pianoplayer/score/MusicXmlScoreSource.h"

#include "pianoplayer/score/PitchNames.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>

#include <algorithm>

namespace pianoplayer::score {

namespace {

static double beatUnitToQuarters(const QString& unit) {
    if (unit == "whole") return 4.0;
    if (unit == "half") return 2.0;
    if (unit == "quarter") return 1.0;
    if (unit == "eighth") return 0.5;
    if (unit == "16th") return 0.25;
    if (unit == "32nd") return 0.125;
    return 1.0;
}

static Dynamic dynamicFromElement(const QString& name) {
    if (name == "pp" || name == "ppp" || name == "pppp") return Dynamic::PP;
    if (name == "p") return Dynamic::P;
    if (name == "mp") return Dynamic::MP;
    if (name == "mf") return Dynamic::MF;
    if (name == "f" || name == "sf" || name == "sfz" || name == "fz") return Dynamic::F;
    if (name == "ff" || name == "fff" || name == "ffff") return Dynamic::FF;
    return Dynamic::None;
}

} // namespace

bool MusicXmlScoreSource::load(const QString& path, Score& out, engine::PlaybackError* err) {
    if (QFileInfo(path).suffix().compare("mxl", Qt::CaseInsensitive) == 0) {
        return engine::fail(err, engine::ErrorKind::Parse,
                            QString("compressed MusicXML is not supported: %1").arg(path));
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return engine::fail(err, engine::ErrorKind::Parse,
                            QString("could not open score file %1: %2").arg(path, file.errorString()));
    }
    return parse(file.readAll(), path, out, err);
}

bool MusicXmlScoreSource::parse(const QByteArray& data, const QString& path, Score& out, engine::PlaybackError* err) {
    out = Score{};
    out.sourcePath = path;
    m_partNames.clear();

    if (data.startsWith("PK")) {
        return engine::fail(err, engine::ErrorKind::Parse,
                            QString("%1 is a compressed MusicXML archive").arg(path));
    }

    QXmlStreamReader xml(data);
    if (!xml.readNextStartElement()) {
        return engine::fail(err, engine::ErrorKind::Parse,
                            QString("%1: %2").arg(path, xml.hasError() ? xml.errorString() : QString("empty document")));
    }
    if (xml.name().toString() != "score-partwise") {
        return engine::fail(err, engine::ErrorKind::Parse,
                            QString("%1: unsupported root element <%2>").arg(path, xml.name().toString()));
    }

    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "work") {
            parseWork(xml, out);
        } else if (name == "movement-title") {
            const QString t = xml.readElementText().trimmed();
            if (out.title.isEmpty()) out.title = t;
        } else if (name == "part-list") {
            parsePartList(xml);
        } else if (name == "part") {
            parsePart(xml, out);
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        return engine::fail(err, engine::ErrorKind::Parse,
                            QString("%1: XML error at line %2: %3")
                                .arg(path)
                                .arg(xml.lineNumber())
                                .arg(xml.errorString()));
    }

    if (out.title.isEmpty()) out.title = QFileInfo(path).completeBaseName();

    qDebug().noquote() << QString("MusicXmlScoreSource: '%1' loaded, %2 voice(s), %3 note(s)")
                              .arg(out.title)
                              .arg(out.voices.size())
                              .arg(out.noteCount());
    return true;
}

void MusicXmlScoreSource::parseWork(QXmlStreamReader& xml, Score& score) {
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "work-title") {
            score.title = xml.readElementText().trimmed();
        } else {
            xml.skipCurrentElement();
        }
    }
}

void MusicXmlScoreSource::parsePartList(QXmlStreamReader& xml) {
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "score-part") {
            const QString id = xml.attributes().value("id").toString();
            while (xml.readNextStartElement()) {
                if (xml.name().toString() == "part-name") {
                    m_partNames[id] = xml.readElementText().trimmed();
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            xml.skipCurrentElement();
        }
    }
}

void MusicXmlScoreSource::parsePart(QXmlStreamReader& xml, Score& score) {
    const QString id = xml.attributes().value("id").toString();

    Voice voice;
    voice.name = m_partNames.value(id, id);
    PartState state;

    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "measure") {
            parseMeasure(xml, score, voice, state);
        } else {
            xml.skipCurrentElement();
        }
    }

    std::stable_sort(voice.notes.begin(), voice.notes.end(),
                     [](const Note& a, const Note& b) { return a.onsetBeat < b.onsetBeat; });
    score.voices.push_back(voice);
}

void MusicXmlScoreSource::parseMeasure(QXmlStreamReader& xml, Score& score, Voice& voice, PartState& state) {
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "attributes") {
            parseAttributes(xml, state);
        } else if (name == "note") {
            parseNote(xml, voice, state);
        } else if (name == "backup") {
            state.cursorBeat = std::max(0.0, state.cursorBeat - readDurationBeats(xml, state));
        } else if (name == "forward") {
            state.cursorBeat += readDurationBeats(xml, state);
        } else if (name == "direction") {
            parseDirection(xml, score, state);
        } else if (name == "sound") {
            const QString tempo = xml.attributes().value("tempo").toString();
            if (!tempo.isEmpty()) score.tempo.addChange(state.cursorBeat, tempo.toDouble());
            xml.skipCurrentElement();
        } else {
            xml.skipCurrentElement();
        }
    }
}

void MusicXmlScoreSource::parseAttributes(QXmlStreamReader& xml, PartState& state) {
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "divisions") {
            const int d = xml.readElementText().toInt();
            if (d > 0) state.divisions = d;
        } else {
            xml.skipCurrentElement();
        }
    }
}

double MusicXmlScoreSource::readDurationBeats(QXmlStreamReader& xml, const PartState& state) {
    double beats = 0.0;
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "duration") {
            beats = xml.readElementText().toDouble() / double(state.divisions);
        } else {
            xml.skipCurrentElement();
        }
    }
    return beats;
}

void MusicXmlScoreSource::parseNote(QXmlStreamReader& xml, Voice& voice, PartState& state) {
    Note note;
    bool isChord = false;
    bool isRest = false;
    bool isGrace = false;
    bool hasPitch = false;
    double durationBeats = 0.0;

    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "grace") {
            isGrace = true;
            xml.skipCurrentElement();
        } else if (name == "chord") {
            isChord = true;
            xml.skipCurrentElement();
        } else if (name == "rest") {
            isRest = true;
            xml.skipCurrentElement();
        } else if (name == "pitch") {
            QChar step;
            int alter = 0;
            int octave = 4;
            while (xml.readNextStartElement()) {
                const QString part = xml.name().toString();
                if (part == "step") {
                    const QString s = xml.readElementText().trimmed();
                    if (!s.isEmpty()) step = s[0];
                } else if (part == "alter") {
                    alter = qRound(xml.readElementText().toDouble());
                } else if (part == "octave") {
                    octave = xml.readElementText().toInt();
                } else {
                    xml.skipCurrentElement();
                }
            }
            hasPitch = pitchFromStep(step, alter, octave, note.pitch);
        } else if (name == "duration") {
            durationBeats = xml.readElementText().toDouble() / double(state.divisions);
        } else if (name == "tie") {
            const QString type = xml.attributes().value("type").toString();
            if (type == "start") note.tiedToNext = true;
            else if (type == "stop") note.tiedFromPrevious = true;
            xml.skipCurrentElement();
        } else if (name == "notations") {
            while (xml.readNextStartElement()) {
                const QString n = xml.name().toString();
                if (n == "tied") {
                    const QString type = xml.attributes().value("type").toString();
                    if (type == "start" || type == "continue") note.tiedToNext = true;
                    if (type == "stop" || type == "continue") note.tiedFromPrevious = true;
                    xml.skipCurrentElement();
                } else if (n == "articulations") {
                    while (xml.readNextStartElement()) {
                        const QString a = xml.name().toString();
                        if (a == "staccato" || a == "staccatissimo") note.staccato = true;
                        xml.skipCurrentElement();
                    }
                } else if (n == "dynamics") {
                    const Dynamic d = parseDynamics(xml);
                    if (d != Dynamic::None) state.pendingDynamic = d;
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            xml.skipCurrentElement();
        }
    }

    if (isGrace) return;

    const double onset = isChord ? state.lastOnsetBeat : state.cursorBeat;
    if (!isChord) {
        state.cursorBeat += durationBeats;
        state.lastOnsetBeat = onset;
    }
    if (isRest || !hasPitch || durationBeats <= 0.0) return;

    note.onsetBeat = onset;
    note.durationBeats = durationBeats;
    note.dynamic = state.pendingDynamic;
    state.pendingDynamic = Dynamic::None;
    voice.notes.push_back(note);
}

void MusicXmlScoreSource::parseDirection(QXmlStreamReader& xml, Score& score, PartState& state) {
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "direction-type") {
            while (xml.readNextStartElement()) {
                const QString t = xml.name().toString();
                if (t == "dynamics") {
                    const Dynamic d = parseDynamics(xml);
                    if (d != Dynamic::None) state.pendingDynamic = d;
                } else if (t == "metronome") {
                    QString unit = "quarter";
                    bool dotted = false;
                    double perMinute = 0.0;
                    while (xml.readNextStartElement()) {
                        const QString m = xml.name().toString();
                        if (m == "beat-unit") {
                            unit = xml.readElementText().trimmed();
                        } else if (m == "beat-unit-dot") {
                            dotted = true;
                            xml.skipCurrentElement();
                        } else if (m == "per-minute") {
                            perMinute = xml.readElementText().toDouble();
                        } else {
                            xml.skipCurrentElement();
                        }
                    }
                    if (perMinute > 0.0) {
                        const double quarters = beatUnitToQuarters(unit) * (dotted ? 1.5 : 1.0);
                        score.tempo.addChange(state.cursorBeat, perMinute * quarters);
                    }
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else if (name == "sound") {
            // <sound tempo> is authoritative and always in quarter notes per minute.
            const QString tempo = xml.attributes().value("tempo").toString();
            if (!tempo.isEmpty()) score.tempo.addChange(state.cursorBeat, tempo.toDouble());
            xml.skipCurrentElement();
        } else {
            xml.skipCurrentElement();
        }
    }
}

Dynamic MusicXmlScoreSource::parseDynamics(QXmlStreamReader& xml) {
    Dynamic d = Dynamic::None;
    while (xml.readNextStartElement()) {
        const Dynamic found = dynamicFromElement(xml.name().toString());
        if (found != Dynamic::None) d = found;
        xml.skipCurrentElement();
    }
    return d;
}

} // namespace pianoplayer::score

#pragma once

#include <QHash>
#include <QString>
#include <QXmlStreamReader>

#include "pianoplayer/score/ScoreSource.h"

namespace pianoplayer::score {

// Reads uncompressed partwise MusicXML (.musicxml / .xml). Each <part> becomes a
// voice. Handles pitch, duration/divisions, chords, rests, backup/forward, ties,
// staccato, dynamics and tempo (<sound tempo> or <metronome>). Grace notes are
// skipped. Compressed .mxl archives are rejected with a ParseError.
class MusicXmlScoreSource final : public ScoreSource {
public:
    bool load(const QString& path, Score& out, engine::PlaybackError* err = nullptr) override;

    // Parses an in-memory document; `path` is only used for titles and messages.
    bool parse(const QByteArray& xml, const QString& path, Score& out, engine::PlaybackError* err = nullptr);

private:
    struct PartState {
        int divisions = 1;
        double cursorBeat = 0.0;
        double lastOnsetBeat = 0.0;
        Dynamic pendingDynamic = Dynamic::None;
    };

    void parseWork(QXmlStreamReader& xml, Score& score);
    void parsePartList(QXmlStreamReader& xml);
    void parsePart(QXmlStreamReader& xml, Score& score);
    void parseMeasure(QXmlStreamReader& xml, Score& score, Voice& voice, PartState& state);
    void parseNote(QXmlStreamReader& xml, Voice& voice, PartState& state);
    void parseDirection(QXmlStreamReader& xml, Score& score, PartState& state);
    void parseAttributes(QXmlStreamReader& xml, PartState& state);
    Dynamic parseDynamics(QXmlStreamReader& xml);
    double readDurationBeats(QXmlStreamReader& xml, const PartState& state);

    QHash<QString, QString> m_partNames; // part id -> part-name
};

} // namespace pianoplayer::score

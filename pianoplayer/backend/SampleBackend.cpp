#include "pianoplayer/backend/SampleBackend.h"

#include <QAudioOutput>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMediaPlayer>
#include <QUrl>

#include "pianoplayer/score/PitchNames.h"

namespace pianoplayer::backend {

namespace {

struct SampleEntry {
    const char* note;
    const char* file;
};

// Note name -> sample file of the bundled piano set.
static const SampleEntry kSampleTable[] = {
    {"C2", "a49.mp3"},  {"C#2", "b49.mp3"}, {"D2", "a50.mp3"},  {"D#2", "b50.mp3"},
    {"E2", "a51.mp3"},  {"F2", "a52.mp3"},  {"F#2", "b52.mp3"}, {"G2", "a53.mp3"},
    {"G#2", "b53.mp3"}, {"A2", "a54.mp3"},  {"B2", "a55.mp3"},
    {"C3", "a56.mp3"},  {"C#3", "b56.mp3"}, {"D3", "a57.mp3"},  {"D#3", "b57.mp3"},
    {"E3", "a48.mp3"},  {"F3", "a81.mp3"},  {"F#3", "b81.mp3"}, {"G3", "a87.mp3"},
    {"G#3", "b87.mp3"}, {"A3", "a69.mp3"},  {"A#3", "b69.mp3"}, {"B3", "a82.mp3"},
    {"C4", "a84.mp3"},  {"C#4", "b84.mp3"}, {"D4", "a89.mp3"},  {"D#4", "b89.mp3"},
    {"E4", "a85.mp3"},  {"F4", "a73.mp3"},  {"F#4", "b73.mp3"}, {"G4", "a79.mp3"},
    {"G#4", "b79.mp3"}, {"A4", "a80.mp3"},  {"A#4", "b80.mp3"}, {"B4", "a65.mp3"},
    {"C5", "a83.mp3"},  {"C#5", "b83.mp3"}, {"D5", "a68.mp3"},  {"D#5", "b68.mp3"},
    {"E5", "a70.mp3"},  {"F5", "a71.mp3"},  {"F#5", "b71.mp3"}, {"G5", "a72.mp3"},
    {"G#5", "b72.mp3"}, {"A5", "a74.mp3"},  {"A#5", "b74.mp3"}, {"B5", "a75.mp3"},
    {"C6", "a76.mp3"},  {"C#6", "b76.mp3"}, {"D6", "a90.mp3"},  {"D#6", "b90.mp3"},
    {"E6", "a88.mp3"},  {"F6", "a67.mp3"},  {"F#6", "b67.mp3"}, {"G6", "a86.mp3"},
    {"G#6", "b86.mp3"},
};

} // namespace

SampleBackend::SampleBackend(const QString& sampleDirectory, QObject* parent)
    : QObject(parent), m_directory(sampleDirectory) {
    connect(this, &SampleBackend::_internal_play, this, &SampleBackend::onInternalPlay, Qt::QueuedConnection);
    connect(this, &SampleBackend::_internal_stopAll, this, &SampleBackend::onInternalStopAll, Qt::QueuedConnection);
}

SampleBackend::~SampleBackend() {
    close();
}

QString SampleBackend::sampleFileForPitch(int pitch) {
    if (pitch < kLowestPitch || pitch > kHighestPitch) return {};
    for (const auto& e : kSampleTable) {
        int notePitch = -1;
        if (score::parseNoteName(QString::fromLatin1(e.note), notePitch) && notePitch == pitch) {
            return QString::fromLatin1(e.file);
        }
    }
    return {};
}

bool SampleBackend::open(QString* error) {
    Q_UNUSED(error);
    if (m_open.load()) return true;

    const QDir dir(m_directory);
    if (!dir.exists()) {
        qWarning().noquote() << "SampleBackend: samples directory not found:" << dir.absolutePath();
    }

    int missing = 0;
    for (int pitch = kLowestPitch; pitch <= kHighestPitch; ++pitch) {
        const QString file = sampleFileForPitch(pitch);
        if (file.isEmpty()) continue;

        const QString path = dir.filePath(file);
        if (!QFileInfo::exists(path)) {
            qDebug().noquote() << QString("SampleBackend: missing sample for %1: %2").arg(score::noteName(pitch), path);
            ++missing;
            continue;
        }

        Voice v;
        v.player = new QMediaPlayer(this);
        v.output = new QAudioOutput(this);
        v.player->setAudioOutput(v.output);
        v.player->setSource(QUrl::fromLocalFile(QFileInfo(path).absoluteFilePath()));
        m_players.insert(pitch, v);
    }

    qInfo().noquote() << QString("SampleBackend: loaded %1 sample(s), %2 missing").arg(m_players.size()).arg(missing);
    if (m_players.isEmpty()) {
        qWarning() << "SampleBackend: no samples loaded, playback will be silent";
    }

    m_open.store(true);
    return true;
}

void SampleBackend::close() {
    if (!m_open.exchange(false)) return;
    for (auto it = m_players.begin(); it != m_players.end(); ++it) {
        it->player->stop();
        delete it->player;
        delete it->output;
    }
    m_players.clear();
}

bool SampleBackend::noteOn(int pitch, int velocity, QString* error) {
    if (!m_open.load()) {
        if (error) *error = "sample backend is not open";
        return false;
    }
    if (pitch < kLowestPitch || pitch > kHighestPitch) {
        if (error) *error = QString("pitch %1 is outside the sample range").arg(score::noteName(pitch));
        return false;
    }
    emit _internal_play(pitch, float(qBound(0, velocity, 127)) / 127.0f);
    return true;
}

bool SampleBackend::noteOff(int pitch, QString* error) {
    // Samples ring out.
    Q_UNUSED(pitch);
    Q_UNUSED(error);
    return true;
}

bool SampleBackend::allNotesOff(QString* error) {
    Q_UNUSED(error);
    if (m_open.load()) emit _internal_stopAll();
    return true;
}

// Executed on the owning (main) thread.
void SampleBackend::onInternalPlay(int pitch, float volume) {
    auto it = m_players.find(pitch);
    if (it == m_players.end()) return;
    it->output->setVolume(volume);
    it->player->stop();
    it->player->play();
}

void SampleBackend::onInternalStopAll() {
    for (auto it = m_players.begin(); it != m_players.end(); ++it) {
        it->player->stop();
    }
}

} // namespace pianoplayer::backend

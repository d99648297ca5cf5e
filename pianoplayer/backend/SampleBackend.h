#pragma once

#include <QHash>
#include <QObject>
#include <QString>

#include <atomic>

#include "pianoplayer/backend/OutputBackend.h"

class QAudioOutput;
class QMediaPlayer;

namespace pianoplayer::backend {

// Plays one pre-recorded piano sample per pitch (C2-G#6) through Qt Multimedia.
//
// The players live on the thread that owns this object (the main thread);
// noteOn()/allNotesOff() may be called from the scheduler thread and are
// forwarded through queued internal signals.
class SampleBackend : public QObject, public OutputBackend {
    Q_OBJECT
public:
    static constexpr int kLowestPitch = 36;  // C2
    static constexpr int kHighestPitch = 92; // G#6

    explicit SampleBackend(const QString& sampleDirectory, QObject* parent = nullptr);
    ~SampleBackend() override;

    // Sample file name for a pitch from the fixed note table; empty if none.
    static QString sampleFileForPitch(int pitch);

    BackendKind kind() const override { return BackendKind::Sample; }
    QString name() const override { return "Samples"; }

    bool open(QString* error = nullptr) override;
    void close() override;
    bool isOpen() const override { return m_open.load(); }

    bool noteOn(int pitch, int velocity, QString* error = nullptr) override;
    bool noteOff(int pitch, QString* error = nullptr) override;
    bool allNotesOff(QString* error = nullptr) override;

    score::PitchRange supportedRange() const override { return {kLowestPitch, kHighestPitch}; }
    bool supportsSustain() const override { return false; }
    bool supportsVelocity() const override { return true; }

    int loadedSampleCount() const { return m_players.size(); }

signals:
    void _internal_play(int pitch, float volume);
    void _internal_stopAll();

private slots:
    void onInternalPlay(int pitch, float volume);
    void onInternalStopAll();

private:
    struct Voice {
        QMediaPlayer* player = nullptr;
        QAudioOutput* output = nullptr;
    };

    QString m_directory;
    QHash<int, Voice> m_players; // pitch -> player; only pitches whose file exists
    std::atomic<bool> m_open{false};
};

} // namespace pianoplayer::backend

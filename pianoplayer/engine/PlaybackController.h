#pragma once

#include <QHash>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>

#include <memory>

#include "pianoplayer/engine/EventSequencer.h"
#include "pianoplayer/engine/PlaybackError.h"
#include "pianoplayer/engine/RangeAnalyzer.h"
#include "pianoplayer/engine/Timeline.h"

namespace pianoplayer::backend {
class OutputBackend;
}
namespace pianoplayer::score {
class ScoreLibrary;
class ScoreSource;
}

namespace pianoplayer::engine {

class PlaybackScheduler;

enum class ControllerState {
    Stopped,
    Playing,
    Paused,
};

enum class ControlEvent {
    SelectPrevious,
    SelectNext,
    StartOrResume,
    Stop,
    PauseToggle,
    Quit,
};

QString controllerStateName(ControllerState s);
QString controlEventName(ControlEvent e);

struct ControllerSettings {
    int tolerance = 0;                // semitones of overhang accepted before melody fallback
    int autoAdvanceDelayMs = 3000;    // gap between a natural end and the next score
    SequencerPolicy sequencer;
};

// Hotkey-driven playback state machine. Lives on the main thread and is the
// only writer of the state and of the current session. Control events and
// scheduler signals reach it as queued calls.
//
//              | Stopped        | Playing            | Paused
// StartOrResume| pick + play    | no-op              | resume
// Stop         | no-op          | stop -> Stopped    | stop -> Stopped
// PauseToggle  | no-op          | pause -> Paused    | resume -> Playing
// Select*      | pointer only, in every state
// Quit         | stop if running, request exit
//
// After a natural end the state stays Playing for the auto-advance gap; Stop
// cancels the gap and PauseToggle freezes what is left of it.
class PlaybackController : public QObject {
    Q_OBJECT
public:
    // `library`, `source` and `backend` are not owned and must outlive the controller.
    PlaybackController(score::ScoreLibrary* library,
                       score::ScoreSource* source,
                       backend::OutputBackend* backend,
                       const ControllerSettings& settings = ControllerSettings{},
                       QObject* parent = nullptr);
    ~PlaybackController() override;

    ControllerState state() const { return m_state; }
    const ControllerSettings& settings() const { return m_settings; }

    bool hasSession() const { return m_session != nullptr; }
    quint64 currentSessionId() const { return m_session ? m_session->id : 0; }
    QString currentScorePath() const { return m_session ? m_session->path : QString(); }
    TimelinePtr currentTimeline() const { return m_session ? m_session->timeline : TimelinePtr(); }

    bool isAdvancePending() const;
    int cachedTimelineCount() const { return m_timelineCache.size(); }

    // Loads, analyzes and sequences a score, reusing a cached timeline when
    // the same score yields the same decision again.
    bool prepareTimeline(const QString& path, TimelinePtr& out, PlaybackError* err = nullptr);

public slots:
    void handleControlEvent(pianoplayer::engine::ControlEvent event);

    void selectPrevious();
    void selectNext();
    void startOrResume();
    void stop();
    void pauseToggle();
    void quit();

signals:
    void stateChanged(pianoplayer::engine::ControllerState state);
    void scoreStarted(const QString& path, const QString& title);
    void statusMessage(const QString& message);
    void playbackError(const QString& message);
    void quitRequested();

private slots:
    void onSchedulerFinished(quint64 sessionId);
    void onSchedulerStopped(quint64 sessionId);
    void onSchedulerFailed(quint64 sessionId, const QString& message);
    void onAdvanceTimeout();

private:
    struct Session {
        quint64 id = 0;
        QString path;
        TimelinePtr timeline;
        std::unique_ptr<PlaybackScheduler> scheduler;
    };

    // Plays the library entry at `index`, skipping unplayable scores for at
    // most one pass over the library. Ends Stopped if nothing could start.
    void startFrom(int index);
    bool startSession(const QString& path, PlaybackError* err);
    void teardownSession();
    void cancelAdvance();
    void pauseCurrent();
    void resumeCurrent();
    void ignored(ControlEvent event);
    void setState(ControllerState s);

    score::ScoreLibrary* m_library = nullptr;
    score::ScoreSource* m_source = nullptr;
    backend::OutputBackend* m_backend = nullptr;
    ControllerSettings m_settings;
    RangeAnalyzer m_analyzer;
    EventSequencer m_sequencer;

    ControllerState m_state = ControllerState::Stopped;
    std::unique_ptr<Session> m_session;
    quint64 m_nextSessionId = 1;

    QTimer m_advanceTimer;
    int m_advanceRemainingMs = -1; // frozen gap while paused, -1 when none

    QHash<QString, std::shared_ptr<const score::Score>> m_scoreCache; // path -> parsed score
    QHash<QString, TimelinePtr> m_timelineCache;                    // path + decision -> timeline
};

} // namespace pianoplayer::engine

Q_DECLARE_METATYPE(pianoplayer::engine::ControlEvent)
Q_DECLARE_METATYPE(pianoplayer::engine::ControllerState)

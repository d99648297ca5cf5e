#pragma once

#include <QObject>
#include <QString>

#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "pianoplayer/engine/PlaybackClock.h"
#include "pianoplayer/engine/Timeline.h"

namespace pianoplayer::backend {
class OutputBackend;
}

namespace pianoplayer::engine {

// Realizes one timeline against one backend on a dedicated timing thread.
//
// pause()/resume()/stop() are non-blocking requests observed at the next wait
// check; stop() also wakes an in-progress wait immediately. join() blocks until
// the timing thread has exited (after stop() that is at most one wait slice).
//
// Signals are emitted from the timing thread and carry the session id so a
// receiver can ignore signals from a session it already tore down.
class PlaybackScheduler : public QObject {
    Q_OBJECT
public:
    enum class RunState {
        Idle,
        Running,
        Paused,
        Finished,
        Stopped,
        Failed,
    };

    // Upper bound for a single wait; pause/stop requests are honored within this.
    static constexpr int kMaxWaitSliceMs = 20;

    explicit PlaybackScheduler(quint64 sessionId = 0, QObject* parent = nullptr);
    ~PlaybackScheduler() override;

    bool start(TimelinePtr timeline, backend::OutputBackend* backend);
    void pause();
    void resume();
    void stop();
    void join();

    quint64 sessionId() const { return m_sessionId; }
    RunState runState() const;
    bool isActive() const;
    qint64 elapsedMs() const;
    int nextEventIndex() const { return m_nextIndex.load(); }

signals:
    void finished(quint64 sessionId);
    void stopped(quint64 sessionId);
    void failed(quint64 sessionId, const QString& message);

private:
    enum class Step {
        Dispatch,
        ReleaseForPause,
        Finish,
        Stop,
    };

    void run();
    bool dispatch(const TimelineEvent& ev, QString* error);
    // NoteOff for every open note; keeps going after a failure and reports the first one.
    bool releaseOpenNotes(QString* error);
    void setRunState(RunState s);

    const quint64 m_sessionId;
    TimelinePtr m_timeline;
    backend::OutputBackend* m_backend = nullptr; // not owned

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_thread;
    bool m_stopRequested = false;  // guarded by m_mutex
    bool m_pauseRequested = false; // guarded by m_mutex
    PlaybackClock m_clock;         // guarded by m_mutex
    RunState m_runState = RunState::Idle;

    // Timing-thread only: note id currently sounding per pitch (0 = silent).
    std::array<quint32, 128> m_openId{};
    std::atomic<int> m_nextIndex{0};
};

} // namespace pianoplayer::engine

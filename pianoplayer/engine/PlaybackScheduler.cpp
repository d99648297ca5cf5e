#include "pianoplayer/engine/PlaybackScheduler.h"

#include "pianoplayer/backend/OutputBackend.h"

#include <QDebug>

#include <algorithm>
#include <chrono>

namespace pianoplayer::engine {

PlaybackScheduler::PlaybackScheduler(quint64 sessionId, QObject* parent)
    : QObject(parent), m_sessionId(sessionId) {
    m_openId.fill(0u);
}

PlaybackScheduler::~PlaybackScheduler() {
    stop();
    join();
}

bool PlaybackScheduler::start(TimelinePtr timeline, backend::OutputBackend* backend) {
    if (!timeline || !backend) return false;
    if (m_thread.joinable()) {
        qWarning() << "PlaybackScheduler: start() while a timeline is already running";
        return false;
    }

    m_timeline = std::move(timeline);
    m_backend = backend;
    m_openId.fill(0u);
    m_nextIndex.store(0);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = false;
        m_pauseRequested = false;
        m_clock.start();
        m_runState = RunState::Running;
    }
    m_thread = std::thread(&PlaybackScheduler::run, this);
    return true;
}

void PlaybackScheduler::pause() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pauseRequested = true;
    }
    m_cv.notify_all();
}

void PlaybackScheduler::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pauseRequested = false;
    }
    m_cv.notify_all();
}

void PlaybackScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
}

void PlaybackScheduler::join() {
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

PlaybackScheduler::RunState PlaybackScheduler::runState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_runState;
}

bool PlaybackScheduler::isActive() const {
    const RunState s = runState();
    return s == RunState::Running || s == RunState::Paused;
}

qint64 PlaybackScheduler::elapsedMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clock.elapsedMs();
}

void PlaybackScheduler::setRunState(RunState s) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_runState = s;
    if (s != RunState::Running && s != RunState::Paused) m_clock.stop();
}

void PlaybackScheduler::run() {
    const QVector<TimelineEvent>& events = m_timeline->events;
    int index = 0;

    for (;;) {
        Step step = Step::Finish;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            for (;;) {
                if (m_stopRequested) {
                    step = Step::Stop;
                    break;
                }
                if (m_pauseRequested && !m_clock.isPaused()) {
                    m_clock.pause();
                    m_runState = RunState::Paused;
                    step = Step::ReleaseForPause;
                    break;
                }
                if (!m_pauseRequested && m_clock.isPaused()) {
                    m_clock.resume();
                    m_runState = RunState::Running;
                }
                if (m_clock.isPaused()) {
                    m_cv.wait(lock);
                    continue;
                }
                if (index >= events.size()) {
                    step = Step::Finish;
                    break;
                }
                const qint64 dueUs = qint64(events[index].timeSec * 1000000.0);
                const qint64 remainingUs = dueUs - m_clock.elapsedUs();
                if (remainingUs <= 0) {
                    step = Step::Dispatch;
                    break;
                }
                const qint64 sliceUs = std::min<qint64>(remainingUs, qint64(kMaxWaitSliceMs) * 1000);
                m_cv.wait_for(lock, std::chrono::microseconds(sliceUs));
            }
        }

        QString error;
        switch (step) {
        case Step::Dispatch:
            if (!dispatch(events[index], &error)) {
                releaseOpenNotes(nullptr);
                setRunState(RunState::Failed);
                qWarning().noquote() << "PlaybackScheduler: backend failure:" << error;
                emit failed(m_sessionId, error);
                return;
            }
            m_nextIndex.store(++index);
            break;

        case Step::ReleaseForPause:
            // Nothing is left hanging while paused; NoteOffs for these ids are dropped later.
            if (!releaseOpenNotes(&error)) {
                setRunState(RunState::Failed);
                emit failed(m_sessionId, error);
                return;
            }
            break;

        case Step::Finish:
            releaseOpenNotes(nullptr);
            setRunState(RunState::Finished);
            emit finished(m_sessionId);
            return;

        case Step::Stop: {
            const bool released = releaseOpenNotes(&error);
            QString panicError;
            if (m_backend->isOpen() && !m_backend->allNotesOff(&panicError)) {
                qWarning().noquote() << "PlaybackScheduler: all-notes-off failed:" << panicError;
            }
            if (!released) {
                setRunState(RunState::Failed);
                emit failed(m_sessionId, error);
                return;
            }
            setRunState(RunState::Stopped);
            emit stopped(m_sessionId);
            return;
        }
        }
    }
}

bool PlaybackScheduler::dispatch(const TimelineEvent& ev, QString* error) {
    if (ev.pitch < 0 || ev.pitch > 127) return true;

    switch (ev.kind) {
    case TimelineEvent::Kind::NoteOn:
        if (m_openId[ev.pitch] != 0u) {
            // Retrigger: close the previous instance first.
            m_openId[ev.pitch] = 0u;
            if (!m_backend->noteOff(ev.pitch, error)) return false;
        }
        if (!m_backend->noteOn(ev.pitch, ev.velocity, error)) return false;
        m_openId[ev.pitch] = ev.noteId;
        return true;

    case TimelineEvent::Kind::NoteOff:
        // Only the instance that is actually sounding may be released.
        if (m_openId[ev.pitch] != ev.noteId) return true;
        m_openId[ev.pitch] = 0u;
        return m_backend->noteOff(ev.pitch, error);
    }
    return true;
}

bool PlaybackScheduler::releaseOpenNotes(QString* error) {
    bool ok = true;
    for (int pitch = 0; pitch < 128; ++pitch) {
        if (m_openId[pitch] == 0u) continue;
        m_openId[pitch] = 0u;
        QString e;
        if (!m_backend->noteOff(pitch, &e)) {
            if (ok && error) *error = e;
            ok = false;
        }
    }
    return ok;
}

} // namespace pianoplayer::engine

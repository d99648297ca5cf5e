#pragma once

#include <QElapsedTimer>

namespace pianoplayer::engine {

// Playback time authority. Elapsed time excludes paused spans: resume()
// re-anchors the monotonic timer so elapsedUs() continues exactly where
// pause() froze it.
class PlaybackClock {
public:
    void start() {
        m_timer.start();
        m_offsetUs = 0;
        m_running = true;
        m_paused = false;
    }
    void stop() {
        m_running = false;
        m_paused = false;
    }

    void pause() {
        if (!m_running || m_paused) return;
        m_offsetUs = elapsedUs();
        m_paused = true;
    }
    void resume() {
        if (!m_running || !m_paused) return;
        m_timer.restart();
        m_paused = false;
    }

    bool isRunning() const { return m_running; }
    bool isPaused() const { return m_paused; }

    qint64 elapsedUs() const {
        if (!m_running) return 0;
        if (m_paused) return m_offsetUs;
        return m_offsetUs + m_timer.nsecsElapsed() / 1000;
    }
    qint64 elapsedMs() const { return elapsedUs() / 1000; }

private:
    bool m_running = false;
    bool m_paused = false;
    qint64 m_offsetUs = 0; // playback time accumulated before the current anchor
    QElapsedTimer m_timer;
};

} // namespace pianoplayer::engine

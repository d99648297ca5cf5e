#include "pianoplayer/engine/PlaybackController.h"

#include <QDebug>
#include <QFileInfo>

#include "pianoplayer/backend/OutputBackend.h"
#include "pianoplayer/engine/PlaybackScheduler.h"
#include "pianoplayer/score/ScoreLibrary.h"
#include "pianoplayer/score/ScoreSource.h"

namespace pianoplayer::engine {

namespace {

static QString timelineKey(const QString& path, const RangeDecision& d) {
    return QString("%1|%2|%3|%4-%5")
        .arg(path, playbackModeName(d.mode))
        .arg(d.octaveShift)
        .arg(d.target.lowest)
        .arg(d.target.highest);
}

} // namespace

QString controllerStateName(ControllerState s) {
    switch (s) {
    case ControllerState::Stopped: return "Stopped";
    case ControllerState::Playing: return "Playing";
    case ControllerState::Paused: return "Paused";
    }
    return "Unknown";
}

QString controlEventName(ControlEvent e) {
    switch (e) {
    case ControlEvent::SelectPrevious: return "SelectPrevious";
    case ControlEvent::SelectNext: return "SelectNext";
    case ControlEvent::StartOrResume: return "StartOrResume";
    case ControlEvent::Stop: return "Stop";
    case ControlEvent::PauseToggle: return "PauseToggle";
    case ControlEvent::Quit: return "Quit";
    }
    return "Unknown";
}

PlaybackController::PlaybackController(score::ScoreLibrary* library,
                                       score::ScoreSource* source,
                                       backend::OutputBackend* backend,
                                       const ControllerSettings& settings,
                                       QObject* parent)
    : QObject(parent),
      m_library(library),
      m_source(source),
      m_backend(backend),
      m_settings(settings),
      m_analyzer(settings.tolerance),
      m_sequencer(settings.sequencer) {
    qRegisterMetaType<pianoplayer::engine::ControlEvent>("pianoplayer::engine::ControlEvent");
    qRegisterMetaType<pianoplayer::engine::ControllerState>("pianoplayer::engine::ControllerState");

    if (m_settings.autoAdvanceDelayMs < 0) m_settings.autoAdvanceDelayMs = 0;

    m_advanceTimer.setSingleShot(true);
    connect(&m_advanceTimer, &QTimer::timeout, this, &PlaybackController::onAdvanceTimeout);
}

PlaybackController::~PlaybackController() {
    cancelAdvance();
    teardownSession();
}

bool PlaybackController::isAdvancePending() const {
    return m_advanceTimer.isActive() || m_advanceRemainingMs >= 0;
}

void PlaybackController::handleControlEvent(ControlEvent event) {
    qDebug().noquote() << QString("PlaybackController: %1 in %2")
                              .arg(controlEventName(event), controllerStateName(m_state));
    switch (event) {
    case ControlEvent::SelectPrevious: selectPrevious(); break;
    case ControlEvent::SelectNext: selectNext(); break;
    case ControlEvent::StartOrResume: startOrResume(); break;
    case ControlEvent::Stop: stop(); break;
    case ControlEvent::PauseToggle: pauseToggle(); break;
    case ControlEvent::Quit: quit(); break;
    }
}

void PlaybackController::selectPrevious() {
    const int index = m_library->selectPrevious();
    if (index < 0) {
        emit statusMessage("No scores to select");
        return;
    }
    emit statusMessage(QString("Selected %1/%2: %3")
                           .arg(index + 1)
                           .arg(m_library->size())
                           .arg(QFileInfo(m_library->pathAt(index)).fileName()));
}

void PlaybackController::selectNext() {
    const int index = m_library->selectNext();
    if (index < 0) {
        emit statusMessage("No scores to select");
        return;
    }
    emit statusMessage(QString("Selected %1/%2: %3")
                           .arg(index + 1)
                           .arg(m_library->size())
                           .arg(QFileInfo(m_library->pathAt(index)).fileName()));
}

void PlaybackController::startOrResume() {
    switch (m_state) {
    case ControllerState::Playing:
        ignored(ControlEvent::StartOrResume);
        return;
    case ControllerState::Paused:
        resumeCurrent();
        return;
    case ControllerState::Stopped:
        break;
    }

    if (m_library->isEmpty()) {
        emit statusMessage("No scores available, add .musicxml files to the scores directory");
        return;
    }
    startFrom(m_library->takeForStart());
}

void PlaybackController::stop() {
    if (m_state == ControllerState::Stopped) {
        ignored(ControlEvent::Stop);
        return;
    }
    cancelAdvance();
    teardownSession();
    setState(ControllerState::Stopped);
    emit statusMessage("Playback stopped");
}

void PlaybackController::pauseToggle() {
    switch (m_state) {
    case ControllerState::Stopped:
        ignored(ControlEvent::PauseToggle);
        return;
    case ControllerState::Playing:
        pauseCurrent();
        return;
    case ControllerState::Paused:
        resumeCurrent();
        return;
    }
}

void PlaybackController::quit() {
    cancelAdvance();
    teardownSession();
    setState(ControllerState::Stopped);
    emit statusMessage("Exiting");
    emit quitRequested();
}

void PlaybackController::pauseCurrent() {
    if (m_session) {
        m_session->scheduler->pause();
    } else if (m_advanceTimer.isActive()) {
        m_advanceRemainingMs = qMax(0, m_advanceTimer.remainingTime());
        m_advanceTimer.stop();
    }
    setState(ControllerState::Paused);
    emit statusMessage("Playback paused");
}

void PlaybackController::resumeCurrent() {
    if (m_session) {
        m_session->scheduler->resume();
    } else if (m_advanceRemainingMs >= 0) {
        m_advanceTimer.start(m_advanceRemainingMs);
        m_advanceRemainingMs = -1;
    }
    setState(ControllerState::Playing);
    emit statusMessage("Playback resumed");
}

void PlaybackController::ignored(ControlEvent event) {
    qDebug().noquote() << QString("PlaybackController: %1: %2 ignored in state %3")
                              .arg(errorKindName(ErrorKind::InvalidTransition),
                                   controlEventName(event),
                                   controllerStateName(m_state));
}

bool PlaybackController::prepareTimeline(const QString& path, TimelinePtr& out, PlaybackError* err) {
    std::shared_ptr<const score::Score> score = m_scoreCache.value(path);
    if (!score) {
        auto loaded = std::make_shared<score::Score>();
        if (!m_source->load(path, *loaded, err)) return false;
        score = loaded;
        m_scoreCache.insert(path, score);
    }

    RangeDecision decision;
    if (!m_analyzer.analyze(*score, m_backend->supportedRange(), decision, err)) return false;

    const QString key = timelineKey(path, decision);
    out = m_timelineCache.value(key);
    if (out) {
        qDebug().noquote() << "PlaybackController: reusing timeline for" << path;
        return true;
    }

    auto timeline = std::make_shared<Timeline>();
    if (!m_sequencer.sequence(*score, decision, *timeline, err)) return false;
    out = timeline;
    m_timelineCache.insert(key, out);
    return true;
}

void PlaybackController::startFrom(int index) {
    const int n = m_library->size();
    for (int attempt = 0; attempt < n && index >= 0; ++attempt) {
        const QString path = m_library->pathAt(index);
        PlaybackError err;
        if (startSession(path, &err)) return;

        if (err.kind == ErrorKind::Backend) {
            // Device trouble is not the score's fault; trying other scores will not help.
            setState(ControllerState::Stopped);
            emit playbackError(err.message);
            emit statusMessage(QString("Playback error: %1").arg(err.message));
            return;
        }

        qWarning().noquote() << QString("PlaybackController: skipping %1: %2: %3")
                                    .arg(QFileInfo(path).fileName(), errorKindName(err.kind), err.message);
        emit statusMessage(QString("Skipping %1 (%2)").arg(QFileInfo(path).fileName(), err.message));
        index = m_library->advance();
    }

    setState(ControllerState::Stopped);
    emit statusMessage("No playable score found");
}

bool PlaybackController::startSession(const QString& path, PlaybackError* err) {
    if (!m_backend || !m_backend->isOpen()) {
        return fail(err, ErrorKind::Backend, "output backend is not open");
    }

    TimelinePtr timeline;
    if (!prepareTimeline(path, timeline, err)) return false;

    teardownSession();

    auto session = std::make_unique<Session>();
    session->id = m_nextSessionId++;
    session->path = path;
    session->timeline = timeline;
    session->scheduler = std::make_unique<PlaybackScheduler>(session->id);

    connect(session->scheduler.get(), &PlaybackScheduler::finished,
            this, &PlaybackController::onSchedulerFinished, Qt::QueuedConnection);
    connect(session->scheduler.get(), &PlaybackScheduler::stopped,
            this, &PlaybackController::onSchedulerStopped, Qt::QueuedConnection);
    connect(session->scheduler.get(), &PlaybackScheduler::failed,
            this, &PlaybackController::onSchedulerFailed, Qt::QueuedConnection);

    if (!session->scheduler->start(timeline, m_backend)) {
        return fail(err, ErrorKind::Backend, "scheduler could not start");
    }
    m_session = std::move(session);
    setState(ControllerState::Playing);

    const QString title = timeline->title.isEmpty() ? QFileInfo(path).completeBaseName() : timeline->title;
    qInfo().noquote() << QString("PlaybackController: playing '%1' [%2] on %3")
                             .arg(title, timeline->decision.describe(), m_backend->name());
    emit statusMessage(QString("Now playing: %1 (%2, %3 notes, %4 s)")
                           .arg(title, timeline->decision.describe())
                           .arg(timeline->noteCount())
                           .arg(timeline->durationSec, 0, 'f', 1));
    emit scoreStarted(path, title);
    return true;
}

void PlaybackController::teardownSession() {
    if (!m_session) return;
    m_session->scheduler->stop();
    m_session->scheduler->join();
    // Queued signals still in flight carry this id and are dropped.
    m_session.reset();
}

void PlaybackController::cancelAdvance() {
    m_advanceTimer.stop();
    m_advanceRemainingMs = -1;
}

void PlaybackController::setState(ControllerState s) {
    if (m_state == s) return;
    qDebug().noquote() << QString("PlaybackController: %1 -> %2")
                              .arg(controllerStateName(m_state), controllerStateName(s));
    m_state = s;
    emit stateChanged(s);
}

void PlaybackController::onSchedulerFinished(quint64 sessionId) {
    if (!m_session || sessionId != m_session->id) return;

    const QString finishedPath = m_session->path;
    teardownSession();

    // State stays Playing through the gap. A pause that landed before this
    // signal holds the whole gap until the next resume.
    if (m_state == ControllerState::Paused) {
        m_advanceTimer.stop();
        m_advanceRemainingMs = m_settings.autoAdvanceDelayMs;
    } else {
        m_advanceRemainingMs = -1;
        m_advanceTimer.start(m_settings.autoAdvanceDelayMs);
    }
    emit statusMessage(QString("Finished %1, next score in %2 s")
                           .arg(QFileInfo(finishedPath).fileName())
                           .arg(m_settings.autoAdvanceDelayMs / 1000.0, 0, 'f', 1));
}

void PlaybackController::onSchedulerStopped(quint64 sessionId) {
    // Stop is torn down synchronously; a stop the controller did not ask for
    // still ends the session.
    if (!m_session || sessionId != m_session->id) return;
    teardownSession();
    cancelAdvance();
    setState(ControllerState::Stopped);
}

void PlaybackController::onSchedulerFailed(quint64 sessionId, const QString& message) {
    if (!m_session || sessionId != m_session->id) return;

    qWarning().noquote() << QString("PlaybackController: %1: %2").arg(errorKindName(ErrorKind::Backend), message);
    teardownSession();
    cancelAdvance();
    setState(ControllerState::Stopped);
    emit playbackError(message);
    emit statusMessage(QString("Playback error: %1").arg(message));
}

void PlaybackController::onAdvanceTimeout() {
    m_advanceRemainingMs = -1;
    if (m_state != ControllerState::Playing || m_session) return;

    // A score picked with SelectPrevious/SelectNext while playing goes next.
    startFrom(m_library->takeForStart());
}

} // namespace pianoplayer::engine

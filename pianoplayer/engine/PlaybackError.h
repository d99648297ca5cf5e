#pragma once

#include <QString>

namespace pianoplayer::engine {

enum class ErrorKind {
    None,
    Parse,             // score unreadable (skip, continue with the next one)
    UnplayableScore,   // range analysis failed even with transposition
    EmptyTimeline,     // nothing to play after analysis
    Backend,           // device failure during playback (session aborted, no retry)
    InvalidTransition, // control event not applicable in the current state (no-op)
};

struct PlaybackError {
    ErrorKind kind = ErrorKind::None;
    QString message;

    bool isSet() const { return kind != ErrorKind::None; }
    void set(ErrorKind k, const QString& msg) {
        kind = k;
        message = msg;
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
};

inline QString errorKindName(ErrorKind k) {
    switch (k) {
    case ErrorKind::None: return "None";
    case ErrorKind::Parse: return "ParseError";
    case ErrorKind::UnplayableScore: return "UnplayableScoreError";
    case ErrorKind::EmptyTimeline: return "EmptyTimelineError";
    case ErrorKind::Backend: return "BackendError";
    case ErrorKind::InvalidTransition: return "InvalidTransitionError";
    }
    return "Unknown";
}

// Convenience for the "bool + optional error out-param" convention.
inline bool fail(PlaybackError* err, ErrorKind kind, const QString& message) {
    if (err) err->set(kind, message);
    return false;
}

} // namespace pianoplayer::engine

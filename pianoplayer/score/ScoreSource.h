#pragma once

#include <QString>

#include "pianoplayer/engine/PlaybackError.h"
#include "pianoplayer/score/Score.h"

namespace pianoplayer::score {

// Boundary to the score parser: given a file path, produce a Score or fail
// with ErrorKind::Parse.
class ScoreSource {
public:
    virtual ~ScoreSource() = default;
    virtual bool load(const QString& path, Score& out, engine::PlaybackError* err = nullptr) = 0;
};

} // namespace pianoplayer::score

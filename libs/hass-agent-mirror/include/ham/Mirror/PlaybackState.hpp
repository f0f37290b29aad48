#pragma once

#include <QString>

namespace ham {

enum class PlaybackState {
    Off,
    Idle,
    Playing,
    Paused,
    Standby,
    Buffering
};

/// Map a raw agent state string (any case) to a PlaybackState.
/// Anything unrecognised, including the empty string, is Idle; only an
/// explicit "off" yields Off.
PlaybackState parsePlaybackState(const QString& raw);

/// Lower-case host state name ("off", "idle", "playing", ...).
QString playbackStateName(PlaybackState state);

} // namespace ham

#include <ham/Mirror/PlaybackState.hpp>

namespace ham {

PlaybackState parsePlaybackState(const QString& raw)
{
    const QString s = raw.toLower();

    if (s == QLatin1String("off"))       return PlaybackState::Off;
    if (s == QLatin1String("idle"))      return PlaybackState::Idle;
    if (s == QLatin1String("playing"))   return PlaybackState::Playing;
    if (s == QLatin1String("paused"))    return PlaybackState::Paused;
    if (s == QLatin1String("standby"))   return PlaybackState::Standby;
    if (s == QLatin1String("buffering")) return PlaybackState::Buffering;

    return PlaybackState::Idle;
}

QString playbackStateName(PlaybackState state)
{
    switch (state) {
    case PlaybackState::Off:       return QStringLiteral("off");
    case PlaybackState::Idle:      return QStringLiteral("idle");
    case PlaybackState::Playing:   return QStringLiteral("playing");
    case PlaybackState::Paused:    return QStringLiteral("paused");
    case PlaybackState::Standby:   return QStringLiteral("standby");
    case PlaybackState::Buffering: return QStringLiteral("buffering");
    }
    return QStringLiteral("idle");
}

} // namespace ham

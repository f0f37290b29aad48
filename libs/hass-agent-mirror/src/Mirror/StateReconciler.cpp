#include <ham/Mirror/StateReconciler.hpp>

#include <boost/log/trivial.hpp>

namespace ham {

StateReconciler::StateReconciler(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(systemNow))
{
}

bool StateReconciler::applyPayload(DeviceMirror& mirror, const QByteArray& payload) const
{
    QString error;
    StateSnapshot snapshot = StateSnapshot::fromJson(payload, &error);
    if (!snapshot.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[StateReconciler] " << mirror.deviceName().toStdString()
                                   << ": dropping malformed state message (" << error.toStdString()
                                   << ", " << payload.size() << " bytes)";
        return false;
    }
    return applySnapshot(mirror, snapshot);
}

bool StateReconciler::applySnapshot(DeviceMirror& mirror, const StateSnapshot& snapshot) const
{
    if (!snapshot.isValid())
        return false;

    const QDateTime now = clock_();
    const PlaybackState playback = parsePlaybackState(snapshot.state);

    mirror.setPlayback(playback);
    mirror.setVolume(snapshot.volume);
    mirror.setMuted(snapshot.muted);
    mirror.markAvailable();

    if (playback != PlaybackState::Off) {
        if (!snapshot.title.isEmpty()) {
            TrackIdentity identity;
            identity.title = snapshot.title;
            identity.artist = snapshot.artist;
            identity.albumName = snapshot.albumTitle;
            identity.albumArtist = snapshot.albumArtist;
            mirror.replaceIdentity(identity);
        }

        if (snapshot.hasDuration)
            mirror.setDuration(snapshot.duration);
        if (snapshot.hasCurrentPosition)
            mirror.setPosition(snapshot.currentPosition, now);
    }

    mirror.markUpdated(now);

    BOOST_LOG_TRIVIAL(trace) << "[StateReconciler] " << mirror.deviceName().toStdString()
                             << ": state=" << playbackStateName(playback).toStdString()
                             << " volume=" << mirror.volume()
                             << " muted=" << mirror.muted();
    return true;
}

} // namespace ham

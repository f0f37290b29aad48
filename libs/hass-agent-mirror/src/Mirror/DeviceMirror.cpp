#include <ham/Mirror/DeviceMirror.hpp>
#include <ham/Version.hpp>

#include <algorithm>

namespace ham {

bool TrackIdentity::operator==(const TrackIdentity& o) const
{
    return title == o.title && artist == o.artist
        && albumName == o.albumName && albumArtist == o.albumArtist;
}

DeviceMirror::DeviceMirror(const QString& deviceId, const QString& deviceName)
    : deviceId_(deviceId)
    , deviceName_(deviceName)
    , topics_(AgentTopics::forDevice(deviceName))
{
}

void DeviceMirror::setVolume(int volume)
{
    volume_ = std::clamp(volume, 0, 100);
}

void DeviceMirror::setDuration(double seconds)
{
    track_.durationSeconds = seconds;
    track_.hasDuration = true;
}

void DeviceMirror::setPosition(double seconds, const QDateTime& at)
{
    track_.positionSeconds = seconds;
    track_.hasPosition = true;
    track_.positionTimestamp = at;
}

bool DeviceMirror::isAvailable(const QDateTime& now) const
{
    if (!lastUpdated_.isValid())
        return false;
    return lastUpdated_.msecsTo(now) < AVAILABILITY_WINDOW_MS;
}

} // namespace ham

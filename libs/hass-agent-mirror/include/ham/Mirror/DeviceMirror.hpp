#pragma once

#include <ham/Mirror/PlaybackState.hpp>
#include <ham/Mirror/Topics.hpp>
#include <QDateTime>
#include <QString>

namespace ham {

/// Track identity. The four fields are only ever replaced together.
struct TrackIdentity {
    QString title;
    QString artist;
    QString albumName;
    QString albumArtist;

    bool isValid() const { return !title.isEmpty(); }
    bool operator==(const TrackIdentity& o) const;
    bool operator!=(const TrackIdentity& o) const { return !(*this == o); }
};

struct TrackInfo {
    TrackIdentity identity;     // isValid() == false until a title is known
    double durationSeconds = 0.0;
    bool hasDuration = false;
    double positionSeconds = 0.0;
    bool hasPosition = false;
    QDateTime positionTimestamp;
    QString imageUrl;
    QString mediaId;
};

/// Locally held copy of one agent's player state.
/// Not thread-safe: owned and mutated on the main thread only.
class DeviceMirror {
public:
    DeviceMirror(const QString& deviceId, const QString& deviceName);

    const QString& deviceId() const { return deviceId_; }
    const QString& deviceName() const { return deviceName_; }
    const AgentTopics& topics() const { return topics_; }
    const QString& commandTopic() const { return topics_.command; }

    PlaybackState playback() const { return playback_; }
    void setPlayback(PlaybackState state) { playback_ = state; }

    /// 0..100, clamped on write.
    int volume() const { return volume_; }
    void setVolume(int volume);
    /// Volume as a 0..1 fraction.
    double volumeLevel() const { return volume_ / 100.0; }

    bool muted() const { return muted_; }
    void setMuted(bool muted) { muted_ = muted; }

    const TrackInfo& track() const { return track_; }
    bool hasTrack() const { return track_.identity.isValid(); }
    void replaceIdentity(const TrackIdentity& identity) { track_.identity = identity; }
    void setDuration(double seconds);
    void setPosition(double seconds, const QDateTime& at);
    void setImageUrl(const QString& url) { track_.imageUrl = url; }
    void setMediaId(const QString& mediaId) { track_.mediaId = mediaId; }

    const QDateTime& lastUpdated() const { return lastUpdated_; }
    void markUpdated(const QDateTime& at) { lastUpdated_ = at; }

    /// Set by every accepted snapshot and by playMedia. Sticky; the live
    /// answer is isAvailable().
    bool markedAvailable() const { return markedAvailable_; }
    void markAvailable() { markedAvailable_ = true; }

    /// True iff a snapshot was accepted less than AVAILABILITY_WINDOW_MS
    /// before `now`. Recomputed on every call.
    bool isAvailable(const QDateTime& now) const;

private:
    QString deviceId_;
    QString deviceName_;
    AgentTopics topics_;

    PlaybackState playback_ = PlaybackState::Idle;
    int volume_ = 0;
    bool muted_ = false;
    TrackInfo track_;
    QDateTime lastUpdated_;
    bool markedAvailable_ = false;
};

} // namespace ham

#include <ham/Mirror/AgentMirror.hpp>
#include <ham/Mirror/MediaFeatures.hpp>
#include <ham/Host/IThumbnailSink.hpp>
#include <ham/Transport/IPubSubTransport.hpp>
#include <ham/Version.hpp>

#include <QRegularExpression>
#include <boost/log/trivial.hpp>

namespace ham {

namespace {

QString slugify(const QString& name)
{
    static const QRegularExpression nonWord(QStringLiteral("[^a-z0-9]+"));

    // Decompose accented letters and drop the marks: "Büro" -> "buro"
    QString folded;
    for (const QChar c : name.normalized(QString::NormalizationForm_KD)) {
        if (!c.isMark())
            folded.append(c);
    }

    QString slug = folded.toLower().replace(nonWord, QStringLiteral("_"));
    while (slug.startsWith('_')) slug.remove(0, 1);
    while (slug.endsWith('_')) slug.chop(1);
    return slug.isEmpty() ? QStringLiteral("unnamed") : slug;
}

} // namespace

AgentMirror::AgentMirror(const DeviceInfo& device, IPubSubTransport* transport,
                         IThumbnailSink* thumbnails, IMediaResolver* resolver,
                         QObject* parent)
    : QObject(parent)
    , device_(device)
    , entityId_(QStringLiteral("media_player.") + slugify(device.name))
    , transport_(transport)
    , thumbnails_(thumbnails)
    , clock_(systemNow)
    , mirror_(device.uniqueId, device.name)
    , reconciler_([this]() { return clock_(); })
    , dispatcher_(mirror_, *transport, resolver, entityId_, [this]() { return clock_(); })
{
}

AgentMirror::~AgentMirror()
{
    stop();
}

void AgentMirror::setClock(Clock clock)
{
    clock_ = clock ? std::move(clock) : Clock(systemNow);
}

bool AgentMirror::start()
{
    if (started_)
        return true;

    const AgentTopics& topics = mirror_.topics();

    stateSubscription_ = transport_->subscribe(topics.state,
        [this](const QString&, const QByteArray& payload) { onStateMessage(payload); },
        SUBSCRIBE_QOS);
    thumbnailSubscription_ = transport_->subscribe(topics.thumbnail,
        [this](const QString&, const QByteArray& payload) { onThumbnailMessage(payload); },
        SUBSCRIBE_QOS);

    if (stateSubscription_ < 0 || thumbnailSubscription_ < 0) {
        BOOST_LOG_TRIVIAL(error) << "[AgentMirror] " << device_.name.toStdString()
                                 << ": transport refused subscriptions";
        if (stateSubscription_ >= 0) transport_->unsubscribe(stateSubscription_);
        if (thumbnailSubscription_ >= 0) transport_->unsubscribe(thumbnailSubscription_);
        stateSubscription_ = -1;
        thumbnailSubscription_ = -1;
        return false;
    }

    started_ = true;
    BOOST_LOG_TRIVIAL(info) << "[AgentMirror] " << entityId_.toStdString()
                            << " listening on " << topics.state.toStdString()
                            << " and " << topics.thumbnail.toStdString();
    return true;
}

void AgentMirror::stop()
{
    if (!started_)
        return;

    started_ = false;
    transport_->unsubscribe(stateSubscription_);
    transport_->unsubscribe(thumbnailSubscription_);
    stateSubscription_ = -1;
    thumbnailSubscription_ = -1;

    BOOST_LOG_TRIVIAL(info) << "[AgentMirror] " << entityId_.toStdString() << " stopped";
}

QString AgentMirror::uniqueId() const
{
    return QStringLiteral("media_player_") + device_.uniqueId;
}

bool AgentMirror::isAvailable() const
{
    return mirror_.isAvailable(clock_());
}

QVariantMap AgentMirror::attributes() const
{
    const TrackInfo& track = mirror_.track();

    QVariantMap attrs;
    attrs["state"] = isAvailable() ? playbackStateName(mirror_.playback())
                                   : QStringLiteral("unavailable");
    attrs["friendly_name"] = device_.name;
    attrs["device_class"] = QString::fromLatin1(AGENT_DEVICE_CLASS);
    attrs["supported_features"] = AGENT_SUPPORTED_FEATURES;
    attrs["volume_level"] = mirror_.volumeLevel();
    attrs["is_volume_muted"] = mirror_.muted();
    attrs["media_content_type"] = QString::fromLatin1(AGENT_MEDIA_CONTENT_TYPE);
    attrs["media_content_id"] = track.mediaId;

    if (track.identity.isValid()) {
        attrs["media_title"] = track.identity.title;
        attrs["media_artist"] = track.identity.artist;
        attrs["media_album_name"] = track.identity.albumName;
        attrs["media_album_artist"] = track.identity.albumArtist;
    }
    if (track.hasDuration)
        attrs["media_duration"] = track.durationSeconds;
    if (track.hasPosition) {
        attrs["media_position"] = track.positionSeconds;
        attrs["media_position_updated_at"] = track.positionTimestamp.toUTC().toString(Qt::ISODateWithMs);
    }
    if (!track.imageUrl.isEmpty())
        attrs["media_image_url"] = track.imageUrl;

    return attrs;
}

bool AgentMirror::acceptsBrowseItem(const QString& mediaContentType)
{
    return mediaContentType.startsWith(QLatin1String("audio/"));
}

DispatchStatus AgentMirror::turnOff()
{
    if (!ensureStarted("turn_off")) return DispatchStatus::Rejected;
    return notifyOptimistic(dispatcher_.turnOff());
}

DispatchStatus AgentMirror::mediaPlay()
{
    if (!ensureStarted("media_play")) return DispatchStatus::Rejected;
    return notifyOptimistic(dispatcher_.play());
}

DispatchStatus AgentMirror::mediaPause()
{
    if (!ensureStarted("media_pause")) return DispatchStatus::Rejected;
    return notifyOptimistic(dispatcher_.pause());
}

DispatchStatus AgentMirror::mediaStop()
{
    if (!ensureStarted("media_stop")) return DispatchStatus::Rejected;
    return notifyOptimistic(dispatcher_.stop());
}

DispatchStatus AgentMirror::mediaNextTrack()
{
    if (!ensureStarted("media_next_track")) return DispatchStatus::Rejected;
    return dispatcher_.next();
}

DispatchStatus AgentMirror::mediaPreviousTrack()
{
    if (!ensureStarted("media_previous_track")) return DispatchStatus::Rejected;
    return dispatcher_.previous();
}

DispatchStatus AgentMirror::volumeUp()
{
    if (!ensureStarted("volume_up")) return DispatchStatus::Rejected;
    return dispatcher_.volumeUp();
}

DispatchStatus AgentMirror::volumeDown()
{
    if (!ensureStarted("volume_down")) return DispatchStatus::Rejected;
    return dispatcher_.volumeDown();
}

DispatchStatus AgentMirror::muteVolume(bool muted)
{
    if (!ensureStarted("volume_mute")) return DispatchStatus::Rejected;
    return dispatcher_.mute(muted);
}

DispatchStatus AgentMirror::setVolumeLevel(double level)
{
    if (!ensureStarted("volume_set")) return DispatchStatus::Rejected;
    return dispatcher_.setVolume(level);
}

DispatchStatus AgentMirror::mediaSeek(double positionSeconds)
{
    if (!ensureStarted("media_seek")) return DispatchStatus::Rejected;
    return notifyOptimistic(dispatcher_.seek(positionSeconds));
}

DispatchStatus AgentMirror::playMedia(const QString& mediaType, const QString& mediaId,
                                      const QVariantMap& extra)
{
    if (!ensureStarted("play_media")) return DispatchStatus::Rejected;
    return notifyOptimistic(dispatcher_.playMedia(mediaType, mediaId, extra));
}

void AgentMirror::onStateMessage(const QByteArray& payload)
{
    if (!started_)
        return;

    if (reconciler_.applyPayload(mirror_, payload))
        emit stateChanged();
}

void AgentMirror::onThumbnailMessage(const QByteArray& payload)
{
    if (!started_)
        return;

    const QString entryKey = device_.entryId.isEmpty() ? device_.uniqueId : device_.entryId;
    QString path = QStringLiteral("/api/hass_agent/%1/thumbnail.png").arg(entityId_);
    if (thumbnails_) {
        thumbnails_->storeThumbnail(entryKey, payload);
        path = thumbnails_->thumbnailPath(entityId_);
    }

    // Cache buster so consumers refetch the image
    const double epochSeconds = clock_().toMSecsSinceEpoch() / 1000.0;
    mirror_.setImageUrl(path + QStringLiteral("?time=") + QString::number(epochSeconds, 'f', 3));

    BOOST_LOG_TRIVIAL(debug) << "[AgentMirror] " << entityId_.toStdString()
                             << ": thumbnail " << payload.size() << " bytes";
    emit stateChanged();
}

bool AgentMirror::ensureStarted(const char* intent) const
{
    if (started_)
        return true;
    BOOST_LOG_TRIVIAL(warning) << "[AgentMirror] " << entityId_.toStdString()
                               << ": " << intent << " ignored, entity not started";
    return false;
}

DispatchStatus AgentMirror::notifyOptimistic(DispatchStatus status)
{
    // Rejected commands never touch the mirror
    if (status != DispatchStatus::Rejected)
        emit stateChanged();
    return status;
}

} // namespace ham

#include <ham/Mirror/CommandDispatcher.hpp>
#include <ham/Host/IMediaResolver.hpp>
#include <ham/Transport/IPubSubTransport.hpp>
#include <ham/Version.hpp>

#include <QJsonDocument>
#include <QJsonObject>
#include <QVariantList>
#include <QtGlobal>
#include <QtNumeric>
#include <cmath>
#include <boost/log/trivial.hpp>

namespace ham {

namespace {

QJsonValue stringOrNull(const QString& s)
{
    return s.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(s);
}

QString firstNonEmpty(const QVariantMap& map, const char* key, const char* fallbackKey)
{
    QString v = map.value(QLatin1String(key)).toString();
    if (v.isEmpty())
        v = map.value(QLatin1String(fallbackKey)).toString();
    return v;
}

QString imageUrlFromMetadata(const QVariantMap& metadata)
{
    const QVariant images = metadata.value(QStringLiteral("images"));
    if (images.canConvert<QVariantList>()) {
        const QVariantList list = images.toList();
        if (!list.isEmpty()) {
            const QString url = list.first().toMap().value(QStringLiteral("url")).toString();
            if (!url.isEmpty())
                return url;
        }
    }
    return metadata.value(QStringLiteral("imageUrl")).toString();
}

} // namespace

QByteArray CommandEnvelope::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("command"), command);
    obj.insert(QStringLiteral("data"), data.isUndefined() ? QJsonValue(QJsonValue::Null) : data);
    obj.insert(QStringLiteral("info"), info.isUndefined() ? QJsonValue(QJsonValue::Null) : info);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

CommandDispatcher::CommandDispatcher(DeviceMirror& mirror, IPubSubTransport& transport,
                                     IMediaResolver* resolver, const QString& entityId,
                                     Clock clock)
    : mirror_(mirror)
    , transport_(transport)
    , resolver_(resolver)
    , entityId_(entityId)
    , clock_(clock ? std::move(clock) : Clock(systemNow))
{
}

DispatchStatus CommandDispatcher::turnOff()
{
    mirror_.setPlayback(PlaybackState::Idle);
    return send(QStringLiteral("pause"));
}

DispatchStatus CommandDispatcher::play()
{
    mirror_.setPlayback(PlaybackState::Playing);
    return send(QStringLiteral("play"));
}

DispatchStatus CommandDispatcher::pause()
{
    mirror_.setPlayback(PlaybackState::Paused);
    return send(QStringLiteral("pause"));
}

DispatchStatus CommandDispatcher::stop()
{
    mirror_.setPlayback(PlaybackState::Idle);
    return send(QStringLiteral("pause"));
}

DispatchStatus CommandDispatcher::next()
{
    return send(QStringLiteral("next"));
}

DispatchStatus CommandDispatcher::previous()
{
    return send(QStringLiteral("previous"));
}

DispatchStatus CommandDispatcher::volumeUp()
{
    return send(QStringLiteral("volumeup"));
}

DispatchStatus CommandDispatcher::volumeDown()
{
    return send(QStringLiteral("volumedown"));
}

DispatchStatus CommandDispatcher::mute(bool muted)
{
    // The agent toggles; it has no explicit mute/unmute command
    Q_UNUSED(muted);
    return send(QStringLiteral("mute"));
}

DispatchStatus CommandDispatcher::setVolume(double level)
{
    if (!qIsFinite(level)) {
        BOOST_LOG_TRIVIAL(error) << "[CommandDispatcher] setvolume rejected: level is not finite";
        return DispatchStatus::Rejected;
    }
    // Halves round to even, matching the agent's own rounding
    const int percent = static_cast<int>(std::nearbyint(qBound(0.0, level, 1.0) * 100.0));
    return send(QStringLiteral("setvolume"), percent);
}

DispatchStatus CommandDispatcher::seek(double positionSeconds)
{
    mirror_.setPosition(positionSeconds, clock_());
    return send(QStringLiteral("seek"), positionSeconds);
}

DispatchStatus CommandDispatcher::playMedia(const QString& mediaType, const QString& mediaId,
                                            const QVariantMap& extra)
{
    if (!isSupportedMediaType(mediaType)) {
        BOOST_LOG_TRIVIAL(error) << "[CommandDispatcher] Invalid media type '"
                                 << mediaType.toStdString() << "'. Only music is supported!";
        return DispatchStatus::Rejected;
    }

    BOOST_LOG_TRIVIAL(debug) << "[CommandDispatcher] Playing media: " << mediaType.toStdString()
                             << ", " << mediaId.toStdString();

    QString url = mediaId;
    if (resolver_) {
        if (resolver_->isMediaSourceId(url)) {
            ResolvedMedia resolved = resolver_->resolve(url, entityId_);
            if (!resolved.isValid()) {
                BOOST_LOG_TRIVIAL(error) << "[CommandDispatcher] Unable to resolve media source '"
                                         << mediaId.toStdString() << "'";
                return DispatchStatus::Rejected;
            }
            url = resolved.url;
        }
        url = resolver_->processPlayMediaUrl(url);
    }

    const QVariantMap metadata = extra.value(QStringLiteral("metadata")).toMap();

    TrackIdentity identity;
    identity.title = metadata.value(QStringLiteral("title")).toString();
    if (identity.title.isEmpty())
        identity.title = QLatin1String(DEFAULT_MEDIA_TITLE);
    identity.artist = metadata.value(QStringLiteral("artist")).toString();
    identity.albumName = firstNonEmpty(metadata, "album_name", "albumtitle");
    identity.albumArtist = firstNonEmpty(metadata, "album_artist", "albumartist");
    const QString imageUrl = imageUrlFromMetadata(metadata);

    mirror_.setMediaId(url);
    mirror_.replaceIdentity(identity);
    mirror_.setImageUrl(imageUrl);
    mirror_.markAvailable();
    mirror_.setPlayback(PlaybackState::Playing);

    QJsonObject info;
    info.insert(QStringLiteral("title"), identity.title);
    info.insert(QStringLiteral("artist"), stringOrNull(identity.artist));
    info.insert(QStringLiteral("albumtitle"), stringOrNull(identity.albumName));
    info.insert(QStringLiteral("albumartist"), stringOrNull(identity.albumArtist));
    info.insert(QStringLiteral("image_url"), stringOrNull(imageUrl));

    return send(QStringLiteral("playmedia"), url, info);
}

bool CommandDispatcher::isSupportedMediaType(const QString& mediaType)
{
    return mediaType.startsWith(QLatin1String("music"))
        || mediaType.startsWith(QLatin1String("audio/"))
        || mediaType.startsWith(QLatin1String("provider"));
}

DispatchStatus CommandDispatcher::send(const QString& command, const QJsonValue& data,
                                       const QJsonValue& info)
{
    BOOST_LOG_TRIVIAL(debug) << "[CommandDispatcher] Sending command: " << command.toStdString()
                             << " -> " << mirror_.commandTopic().toStdString();

    CommandEnvelope envelope{command, data, info};
    if (!transport_.publish(mirror_.commandTopic(), envelope.toJson(), PUBLISH_QOS)) {
        BOOST_LOG_TRIVIAL(warning) << "[CommandDispatcher] " << command.toStdString()
                                   << " not delivered to " << mirror_.deviceName().toStdString()
                                   << ": transport unavailable";
        return DispatchStatus::TransportFailed;
    }
    return DispatchStatus::Sent;
}

} // namespace ham

#pragma once

#include <ham/Mirror/Clock.hpp>
#include <ham/Mirror/DeviceMirror.hpp>
#include <QByteArray>
#include <QJsonValue>
#include <QVariantMap>

namespace ham {

class IPubSubTransport;
class IMediaResolver;

enum class DispatchStatus {
    Sent,              // handed to the transport
    Rejected,          // invalid argument, nothing published, mirror untouched
    TransportFailed    // transport refused the publish; optimistic state kept
};

/// Outbound command envelope: {"command": ..., "data": ..., "info": ...}
struct CommandEnvelope {
    QString command;
    QJsonValue data;   // Null when unused
    QJsonValue info;   // Null when unused

    QByteArray toJson() const;
};

/// Translates player intents into exactly one command publish on the
/// device's command topic, applying optimistic mirror updates first.
///
/// Note: stop, turnOff and pause all go out as "pause", and mute is always
/// "mute" whatever the requested state. The agent only understands these.
class CommandDispatcher {
public:
    /// `resolver` may be null, in which case media ids are sent unchanged.
    CommandDispatcher(DeviceMirror& mirror, IPubSubTransport& transport,
                      IMediaResolver* resolver, const QString& entityId,
                      Clock clock = systemNow);

    DispatchStatus turnOff();
    DispatchStatus play();
    DispatchStatus pause();
    DispatchStatus stop();
    DispatchStatus next();
    DispatchStatus previous();
    DispatchStatus volumeUp();
    DispatchStatus volumeDown();
    DispatchStatus mute(bool muted);
    DispatchStatus setVolume(double level);
    DispatchStatus seek(double positionSeconds);

    /// `extra` follows the host's media extra layout:
    /// {"metadata": {"title", "artist", "album_name"|"albumtitle",
    ///               "album_artist"|"albumartist", "images": [{"url"}], "imageUrl"}}
    DispatchStatus playMedia(const QString& mediaType, const QString& mediaId,
                             const QVariantMap& extra = {});

    static bool isSupportedMediaType(const QString& mediaType);

private:
    DispatchStatus send(const QString& command,
                        const QJsonValue& data = QJsonValue(),
                        const QJsonValue& info = QJsonValue());

    DeviceMirror& mirror_;
    IPubSubTransport& transport_;
    IMediaResolver* resolver_;
    QString entityId_;
    Clock clock_;
};

} // namespace ham

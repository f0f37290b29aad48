#pragma once

#include <ham/Host/IDeviceRegistry.hpp>
#include <ham/Mirror/Clock.hpp>
#include <ham/Mirror/CommandDispatcher.hpp>
#include <ham/Mirror/DeviceMirror.hpp>
#include <ham/Mirror/StateReconciler.hpp>
#include <QObject>
#include <QVariantMap>

namespace ham {

class IPubSubTransport;
class IThumbnailSink;
class IMediaResolver;

/// Host-side media player entity for one HASS.Agent device.
///
/// Subscribes to the agent's state and thumbnail topics, reconciles inbound
/// snapshots into its DeviceMirror and forwards player intents to the
/// agent's command topic. Lives on (and must be driven from) the thread
/// that owns the transport.
class AgentMirror : public QObject {
    Q_OBJECT
public:
    /// `thumbnails` and `resolver` may be null.
    AgentMirror(const DeviceInfo& device, IPubSubTransport* transport,
                IThumbnailSink* thumbnails, IMediaResolver* resolver,
                QObject* parent = nullptr);
    ~AgentMirror() override;

    /// Replace the wall clock. Call before start().
    void setClock(Clock clock);

    /// Subscribe to the state and thumbnail topics. Returns false if the
    /// transport refused either subscription (nothing is left subscribed).
    bool start();

    /// Cancel subscriptions. Safe to call repeatedly; messages that arrive
    /// afterwards are ignored.
    void stop();
    bool isStarted() const { return started_; }

    // Identity
    QString uniqueId() const;
    QString entityId() const { return entityId_; }
    QString name() const { return device_.name; }
    const DeviceInfo& deviceInfo() const { return device_; }
    const DeviceMirror& mirror() const { return mirror_; }

    // Host-facing state
    bool isAvailable() const;
    PlaybackState state() const { return mirror_.playback(); }
    double volumeLevel() const { return mirror_.volumeLevel(); }
    bool isVolumeMuted() const { return mirror_.muted(); }
    QString mediaContentId() const { return mirror_.track().mediaId; }
    QString mediaImageUrl() const { return mirror_.track().imageUrl; }

    /// Attribute map published to the host's state registry.
    QVariantMap attributes() const;

    /// Media browser filter: only audio sources are offered.
    static bool acceptsBrowseItem(const QString& mediaContentType);

    // Player intents. Each publishes exactly one command unless rejected.
    DispatchStatus turnOff();
    DispatchStatus mediaPlay();
    DispatchStatus mediaPause();
    DispatchStatus mediaStop();
    DispatchStatus mediaNextTrack();
    DispatchStatus mediaPreviousTrack();
    DispatchStatus volumeUp();
    DispatchStatus volumeDown();
    DispatchStatus muteVolume(bool muted);
    DispatchStatus setVolumeLevel(double level);
    DispatchStatus mediaSeek(double positionSeconds);
    DispatchStatus playMedia(const QString& mediaType, const QString& mediaId,
                             const QVariantMap& extra = {});

signals:
    /// Emitted once per applied snapshot, thumbnail or optimistic command.
    void stateChanged();

private:
    void onStateMessage(const QByteArray& payload);
    void onThumbnailMessage(const QByteArray& payload);
    bool ensureStarted(const char* intent) const;
    DispatchStatus notifyOptimistic(DispatchStatus status);

    DeviceInfo device_;
    QString entityId_;
    IPubSubTransport* transport_;
    IThumbnailSink* thumbnails_;
    Clock clock_;
    DeviceMirror mirror_;
    StateReconciler reconciler_;
    CommandDispatcher dispatcher_;

    bool started_ = false;
    int stateSubscription_ = -1;
    int thumbnailSubscription_ = -1;
};

} // namespace ham

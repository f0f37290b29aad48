#pragma once

#include <ham/Mirror/AgentMirror.hpp>
#include <QHash>
#include <QObject>
#include <QTimer>
#include <memory>
#include <vector>

namespace ham {
class IDeviceRegistry;
class IMediaResolver;
class IPubSubTransport;
class IThumbnailSink;
}

namespace hab {

class ServiceCallRegistry;
class StateRegistry;

/// Owns one AgentMirror per configured entry, publishes their attributes to
/// the StateRegistry and exposes their intents as media_player services.
class BridgeHost : public QObject {
    Q_OBJECT
public:
    BridgeHost(const ham::IDeviceRegistry& registry, ham::IPubSubTransport* transport,
               ham::IThumbnailSink* thumbnails, ham::IMediaResolver* resolver,
               StateRegistry* states, ServiceCallRegistry* services,
               QObject* parent = nullptr);
    ~BridgeHost() override;

    /// Used by entities created afterwards.
    void setClock(ham::Clock clock);

    /// Create and start an entity for each unique id. Unknown devices are
    /// logged and skipped. Returns the number of entities started.
    int setupEntries(const QStringList& uniqueIds);

    /// Stop an entity and drop its state and services.
    bool unloadEntry(const QString& uniqueId);
    void unloadAll();

    ham::AgentMirror* entity(const QString& entityId) const;
    QStringList entityIds() const;

    /// Republish attributes of entities whose availability changed since the
    /// last publish. Driven by a one-second timer while entities exist.
    void refreshAvailability();

private:
    void registerServices(ham::AgentMirror* entity);
    void publishState(ham::AgentMirror* entity);

    const ham::IDeviceRegistry& registry_;
    ham::IPubSubTransport* transport_;
    ham::IThumbnailSink* thumbnails_;
    ham::IMediaResolver* resolver_;
    StateRegistry* states_;
    ServiceCallRegistry* services_;
    ham::Clock clock_;

    std::vector<std::unique_ptr<ham::AgentMirror>> entities_;
    QHash<QString, bool> lastAvailable_;
    QTimer availabilityTimer_;
};

} // namespace hab

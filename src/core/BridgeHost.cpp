#include "core/BridgeHost.hpp"
#include "core/services/ServiceCallRegistry.hpp"
#include "core/services/StateRegistry.hpp"
#include <ham/Host/IDeviceRegistry.hpp>
#include <boost/log/trivial.hpp>

namespace hab {

namespace {

bool accepted(ham::DispatchStatus status)
{
    return status == ham::DispatchStatus::Sent;
}

} // namespace

BridgeHost::BridgeHost(const ham::IDeviceRegistry& registry, ham::IPubSubTransport* transport,
                       ham::IThumbnailSink* thumbnails, ham::IMediaResolver* resolver,
                       StateRegistry* states, ServiceCallRegistry* services, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , transport_(transport)
    , thumbnails_(thumbnails)
    , resolver_(resolver)
    , states_(states)
    , services_(services)
    , clock_(ham::systemNow)
{
    availabilityTimer_.setInterval(1000);
    connect(&availabilityTimer_, &QTimer::timeout, this, &BridgeHost::refreshAvailability);
}

BridgeHost::~BridgeHost()
{
    unloadAll();
}

void BridgeHost::setClock(ham::Clock clock)
{
    clock_ = std::move(clock);
}

int BridgeHost::setupEntries(const QStringList& uniqueIds)
{
    int started = 0;
    for (const auto& uniqueId : uniqueIds) {
        ham::DeviceInfo info = registry_.device(uniqueId);
        if (!info.isValid()) {
            BOOST_LOG_TRIVIAL(error) << "[BridgeHost] Device " << uniqueId.toStdString()
                                     << " not found in registry, skipping";
            continue;
        }

        auto entity = std::make_unique<ham::AgentMirror>(info, transport_, thumbnails_, resolver_);
        entity->setClock(clock_);
        if (this->entity(entity->entityId())) {
            BOOST_LOG_TRIVIAL(error) << "[BridgeHost] Duplicate entity "
                                     << entity->entityId().toStdString() << ", skipping";
            continue;
        }
        if (!entity->start()) {
            BOOST_LOG_TRIVIAL(error) << "[BridgeHost] Could not subscribe for "
                                     << info.name.toStdString();
            continue;
        }

        ham::AgentMirror* raw = entity.get();
        connect(raw, &ham::AgentMirror::stateChanged, this, [this, raw]() {
            publishState(raw);
        });
        registerServices(raw);
        entities_.push_back(std::move(entity));
        publishState(raw);

        BOOST_LOG_TRIVIAL(info) << "[BridgeHost] Started " << raw->entityId().toStdString()
                                << " (" << info.name.toStdString() << ")";
        ++started;
    }

    if (!entities_.empty() && !availabilityTimer_.isActive())
        availabilityTimer_.start();
    return started;
}

bool BridgeHost::unloadEntry(const QString& uniqueId)
{
    for (auto it = entities_.begin(); it != entities_.end(); ++it) {
        ham::AgentMirror* entity = it->get();
        if (entity->deviceInfo().uniqueId != uniqueId)
            continue;

        const QString entityId = entity->entityId();
        entity->stop();
        if (services_)
            services_->unregisterEntity(entityId);
        if (states_)
            states_->removeState(entityId);
        lastAvailable_.remove(entityId);
        entities_.erase(it);

        if (entities_.empty())
            availabilityTimer_.stop();
        BOOST_LOG_TRIVIAL(info) << "[BridgeHost] Unloaded " << entityId.toStdString();
        return true;
    }
    return false;
}

void BridgeHost::unloadAll()
{
    while (!entities_.empty())
        unloadEntry(entities_.front()->deviceInfo().uniqueId);
}

ham::AgentMirror* BridgeHost::entity(const QString& entityId) const
{
    for (const auto& entity : entities_) {
        if (entity->entityId() == entityId)
            return entity.get();
    }
    return nullptr;
}

QStringList BridgeHost::entityIds() const
{
    QStringList ids;
    for (const auto& entity : entities_)
        ids.append(entity->entityId());
    return ids;
}

void BridgeHost::refreshAvailability()
{
    for (const auto& entity : entities_) {
        if (lastAvailable_.value(entity->entityId()) != entity->isAvailable())
            publishState(entity.get());
    }
}

void BridgeHost::publishState(ham::AgentMirror* entity)
{
    lastAvailable_[entity->entityId()] = entity->isAvailable();
    if (states_)
        states_->setState(entity->entityId(), entity->attributes());
}

void BridgeHost::registerServices(ham::AgentMirror* entity)
{
    if (!services_)
        return;

    const QString id = entity->entityId();
    services_->registerService("turn_off", id, [entity](const QVariantMap&) {
        return accepted(entity->turnOff());
    });
    services_->registerService("media_play", id, [entity](const QVariantMap&) {
        return accepted(entity->mediaPlay());
    });
    services_->registerService("media_pause", id, [entity](const QVariantMap&) {
        return accepted(entity->mediaPause());
    });
    services_->registerService("media_stop", id, [entity](const QVariantMap&) {
        return accepted(entity->mediaStop());
    });
    services_->registerService("media_next_track", id, [entity](const QVariantMap&) {
        return accepted(entity->mediaNextTrack());
    });
    services_->registerService("media_previous_track", id, [entity](const QVariantMap&) {
        return accepted(entity->mediaPreviousTrack());
    });
    services_->registerService("volume_up", id, [entity](const QVariantMap&) {
        return accepted(entity->volumeUp());
    });
    services_->registerService("volume_down", id, [entity](const QVariantMap&) {
        return accepted(entity->volumeDown());
    });
    services_->registerService("volume_mute", id, [entity](const QVariantMap& data) {
        return accepted(entity->muteVolume(data.value("is_volume_muted").toBool()));
    });
    services_->registerService("volume_set", id, [entity](const QVariantMap& data) {
        if (!data.contains("volume_level")) {
            BOOST_LOG_TRIVIAL(error) << "[BridgeHost] volume_set without volume_level";
            return false;
        }
        return accepted(entity->setVolumeLevel(data.value("volume_level").toDouble()));
    });
    services_->registerService("media_seek", id, [entity](const QVariantMap& data) {
        if (!data.contains("seek_position")) {
            BOOST_LOG_TRIVIAL(error) << "[BridgeHost] media_seek without seek_position";
            return false;
        }
        return accepted(entity->mediaSeek(data.value("seek_position").toDouble()));
    });
    services_->registerService("play_media", id, [entity](const QVariantMap& data) {
        return accepted(entity->playMedia(data.value("media_content_type").toString(),
                                          data.value("media_content_id").toString(),
                                          data.value("extra").toMap()));
    });
}

} // namespace hab

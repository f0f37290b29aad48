#include "ServiceCallRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace hab {

ServiceCallRegistry::ServiceCallRegistry(QObject* parent) : QObject(parent) {}

QString ServiceCallRegistry::key(const QString& service, const QString& entityId)
{
    return entityId + QLatin1Char('/') + service;
}

void ServiceCallRegistry::registerService(const QString& service, const QString& entityId,
                                          Handler handler)
{
    handlers_[key(service, entityId)] = std::move(handler);
}

void ServiceCallRegistry::unregisterEntity(const QString& entityId)
{
    const QString prefix = entityId + QLatin1Char('/');
    for (auto it = handlers_.begin(); it != handlers_.end();) {
        if (it.key().startsWith(prefix))
            it = handlers_.erase(it);
        else
            ++it;
    }
}

bool ServiceCallRegistry::call(const QString& service, const QString& entityId,
                               const QVariantMap& data)
{
    auto it = handlers_.find(key(service, entityId));
    if (it == handlers_.end()) {
        BOOST_LOG_TRIVIAL(debug) << "[ServiceCallRegistry] No handler for "
                                 << service.toStdString() << " on " << entityId.toStdString();
        return false;
    }
    // Copy: a handler may unregister its own entity
    Handler handler = it.value();
    bool accepted = handler(data);
    emit serviceCalled(service, entityId, accepted);
    return accepted;
}

QStringList ServiceCallRegistry::services(const QString& entityId) const
{
    const QString prefix = entityId + QLatin1Char('/');
    QStringList result;
    for (auto it = handlers_.constBegin(); it != handlers_.constEnd(); ++it) {
        if (it.key().startsWith(prefix))
            result.append(it.key().mid(prefix.size()));
    }
    result.sort();
    return result;
}

} // namespace hab

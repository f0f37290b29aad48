#include "StateRegistry.hpp"
#include <QMetaObject>
#include <algorithm>

namespace hab {

StateRegistry::StateRegistry(QObject* parent) : QObject(parent) {}

void StateRegistry::setState(const QString& entityId, const QVariantMap& attributes)
{
    QMutexLocker lock(&mutex_);
    auto it = states_.find(entityId);
    if (it != states_.end() && it.value() == attributes)
        return;
    states_[entityId] = attributes;
    notify(entityId, attributes);
}

void StateRegistry::removeState(const QString& entityId)
{
    QMutexLocker lock(&mutex_);
    if (states_.remove(entityId) > 0)
        notify(entityId, {});
}

QVariantMap StateRegistry::state(const QString& entityId) const
{
    QMutexLocker lock(&mutex_);
    return states_.value(entityId);
}

QStringList StateRegistry::entityIds() const
{
    QMutexLocker lock(&mutex_);
    QStringList ids = states_.keys();
    ids.sort();
    return ids;
}

int StateRegistry::subscribe(const QString& entityId, Callback callback)
{
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    subscriptions_[id] = {entityId, std::move(callback)};
    entityIndex_.insert(entityId, id);
    return id;
}

void StateRegistry::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) return;
    entityIndex_.remove(it->entityId, subscriptionId);
    subscriptions_.erase(it);
}

// Caller holds mutex_
void StateRegistry::notify(const QString& entityId, const QVariantMap& attributes)
{
    QList<int> ids = entityIndex_.values(entityId);
    ids += entityIndex_.values(QString());
    std::sort(ids.begin(), ids.end());

    for (int id : ids) {
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) continue;
        auto cb = it->callback;
        QMetaObject::invokeMethod(this, [cb, entityId, attributes]() {
            cb(entityId, attributes);
        }, Qt::QueuedConnection);
    }
}

} // namespace hab

#pragma once

#include <QObject>
#include <QMutex>
#include <QHash>
#include <QMultiHash>
#include <QVariantMap>
#include <functional>

namespace hab {

/// Latest attribute map per entity, with change listeners.
/// Thread-safe; listeners are invoked on this object's thread via
/// QueuedConnection.
class StateRegistry : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const QString& entityId, const QVariantMap& attributes)>;

    explicit StateRegistry(QObject* parent = nullptr);

    /// Store `attributes` for `entityId`. Listeners are notified only when
    /// the map differs from the stored one.
    void setState(const QString& entityId, const QVariantMap& attributes);
    void removeState(const QString& entityId);

    QVariantMap state(const QString& entityId) const;
    QStringList entityIds() const;

    /// Listen to one entity, or to every entity when `entityId` is empty.
    int subscribe(const QString& entityId, Callback callback);
    void unsubscribe(int subscriptionId);

private:
    struct Subscription {
        QString entityId;
        Callback callback;
    };

    void notify(const QString& entityId, const QVariantMap& attributes);

    mutable QMutex mutex_;
    QHash<QString, QVariantMap> states_;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
    QMultiHash<QString, int> entityIndex_;
};

} // namespace hab

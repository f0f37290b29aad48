#pragma once

#include <QObject>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <functional>

namespace hab {

/// Registry for media_player service handlers, keyed by service name and
/// target entity. Calls are synchronous and must happen on the main thread.
class ServiceCallRegistry : public QObject {
    Q_OBJECT
public:
    /// Returns true when the call was accepted and sent.
    using Handler = std::function<bool(const QVariantMap& data)>;

    explicit ServiceCallRegistry(QObject* parent = nullptr);

    void registerService(const QString& service, const QString& entityId, Handler handler);
    void unregisterEntity(const QString& entityId);

    /// Route a call to the handler registered for (service, entityId).
    /// Returns false for unknown targets or when the handler declines.
    Q_INVOKABLE bool call(const QString& service, const QString& entityId,
                          const QVariantMap& data = {});

    QStringList services(const QString& entityId) const;

signals:
    void serviceCalled(const QString& service, const QString& entityId, bool accepted);

private:
    static QString key(const QString& service, const QString& entityId);

    QHash<QString, Handler> handlers_;
};

} // namespace hab

#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>
#include <functional>

namespace ham {

/// Topic-based publish/subscribe transport (an MQTT client in production).
/// Handlers are invoked on the thread that owns the transport.
class IPubSubTransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IPubSubTransport() override = default;

    using MessageHandler = std::function<void(const QString& topic, const QByteArray& payload)>;

    /// Register interest in a topic. Returns a subscription ID, or -1 if the
    /// request was refused (invalid topic).
    virtual int subscribe(const QString& topic, MessageHandler handler, quint8 qos = 0) = 0;

    /// Cancel a subscription. Unknown IDs are ignored.
    virtual void unsubscribe(int subscriptionId) = 0;

    /// Fire-and-forget publish. Returns false if the message could not be
    /// handed to the broker connection.
    virtual bool publish(const QString& topic, const QByteArray& payload, quint8 qos = 0) = 0;

    virtual bool isConnected() const = 0;

signals:
    void connected();
    void disconnected();
    void error(const QString& message);
};

} // namespace ham

#pragma once

#include <ham/Transport/IPubSubTransport.hpp>
#include <QHash>
#include <QMetaObject>
#include <QMqttClient>
#include <QPointer>

class QMqttSubscription;

namespace ham {

struct MqttSettings {
    QString host = QStringLiteral("localhost");
    quint16 port = 1883;
    QString username;
    QString password;
    QString clientId = QStringLiteral("hass-agent-bridge");
    quint16 keepAliveSeconds = 60;
};

/// IPubSubTransport backed by a QMqttClient.
/// Subscriptions requested while the broker is unreachable are remembered
/// and issued on every (re)connect.
class MqttTransport : public IPubSubTransport {
    Q_OBJECT
public:
    explicit MqttTransport(const MqttSettings& settings, QObject* parent = nullptr);
    ~MqttTransport() override;

    void connectToBroker();
    void disconnectFromBroker();

    int subscribe(const QString& topic, MessageHandler handler, quint8 qos = 0) override;
    void unsubscribe(int subscriptionId) override;
    bool publish(const QString& topic, const QByteArray& payload, quint8 qos = 0) override;
    bool isConnected() const override;

private:
    struct Subscription {
        QString topic;
        MessageHandler handler;
        quint8 qos = 0;
        QPointer<QMqttSubscription> handle;
        QMetaObject::Connection connection;
    };

    void onConnected();
    void onDisconnected();
    void onErrorChanged(QMqttClient::ClientError clientError);
    void activate(int subscriptionId, Subscription& sub);
    bool topicStillWanted(const QString& topic) const;

    MqttSettings settings_;
    QMqttClient* client_ = nullptr;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
};

} // namespace ham

#pragma once

#include <ham/Transport/IPubSubTransport.hpp>
#include <QHash>
#include <QList>
#include <QStringList>

namespace ham {

/// In-process transport used by tests and offline replays. Publishes are
/// captured instead of sent; inbound traffic is injected with feedMessage().
class ReplayTransport : public IPubSubTransport {
    Q_OBJECT
public:
    struct PublishedMessage {
        QString topic;
        QByteArray payload;
        quint8 qos = 0;
    };

    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    // IPubSubTransport interface
    int subscribe(const QString& topic, MessageHandler handler, quint8 qos = 0) override;
    void unsubscribe(int subscriptionId) override;
    bool publish(const QString& topic, const QByteArray& payload, quint8 qos = 0) override;
    bool isConnected() const override;

    // Test API
    void feedMessage(const QString& topic, const QByteArray& payload);
    void simulateConnect();
    void simulateDisconnect();
    void setPublishFailure(bool fail);
    QList<PublishedMessage> published() const;
    void clearPublished();
    QStringList subscribedTopics() const;
    quint8 subscriptionQos(const QString& topic) const;

private:
    struct Subscription {
        QString topic;
        MessageHandler handler;
        quint8 qos = 0;
    };

    bool connected_ = false;
    bool failPublish_ = false;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
    QList<PublishedMessage> published_;
};

} // namespace ham

#include <ham/Transport/ReplayTransport.hpp>

#include <algorithm>

namespace ham {

ReplayTransport::ReplayTransport(QObject* parent)
    : IPubSubTransport(parent)
{
}

ReplayTransport::~ReplayTransport() = default;

int ReplayTransport::subscribe(const QString& topic, MessageHandler handler, quint8 qos)
{
    if (topic.isEmpty() || !handler)
        return -1;

    int id = nextId_++;
    subscriptions_.insert(id, {topic, std::move(handler), qos});
    return id;
}

void ReplayTransport::unsubscribe(int subscriptionId)
{
    subscriptions_.remove(subscriptionId);
}

bool ReplayTransport::publish(const QString& topic, const QByteArray& payload, quint8 qos)
{
    if (failPublish_)
        return false;

    published_.append({topic, payload, qos});
    return true;
}

bool ReplayTransport::isConnected() const
{
    return connected_;
}

void ReplayTransport::feedMessage(const QString& topic, const QByteArray& payload)
{
    // Copy handlers first: a handler may unsubscribe while we iterate
    QList<MessageHandler> handlers;
    QList<int> ids = subscriptions_.keys();
    std::sort(ids.begin(), ids.end());
    for (int id : ids) {
        const auto& sub = subscriptions_[id];
        if (sub.topic == topic)
            handlers.append(sub.handler);
    }

    for (const auto& handler : handlers)
        handler(topic, payload);
}

void ReplayTransport::simulateConnect()
{
    connected_ = true;
    emit connected();
}

void ReplayTransport::simulateDisconnect()
{
    connected_ = false;
    emit disconnected();
}

void ReplayTransport::setPublishFailure(bool fail)
{
    failPublish_ = fail;
}

QList<ReplayTransport::PublishedMessage> ReplayTransport::published() const
{
    return published_;
}

void ReplayTransport::clearPublished()
{
    published_.clear();
}

QStringList ReplayTransport::subscribedTopics() const
{
    QStringList topics;
    for (const auto& sub : subscriptions_)
        topics.append(sub.topic);
    topics.sort();
    return topics;
}

quint8 ReplayTransport::subscriptionQos(const QString& topic) const
{
    for (const auto& sub : subscriptions_) {
        if (sub.topic == topic)
            return sub.qos;
    }
    return 0;
}

} // namespace ham

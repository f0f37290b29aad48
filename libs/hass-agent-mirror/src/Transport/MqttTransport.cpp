#include <ham/Transport/MqttTransport.hpp>

#include <QMqttMessage>
#include <QMqttSubscription>
#include <QMqttTopicFilter>
#include <QMqttTopicName>
#include <boost/log/trivial.hpp>

namespace ham {

MqttTransport::MqttTransport(const MqttSettings& settings, QObject* parent)
    : IPubSubTransport(parent)
    , settings_(settings)
    , client_(new QMqttClient(this))
{
    client_->setHostname(settings_.host);
    client_->setPort(settings_.port);
    client_->setClientId(settings_.clientId);
    client_->setKeepAlive(settings_.keepAliveSeconds);
    if (!settings_.username.isEmpty()) {
        client_->setUsername(settings_.username);
        client_->setPassword(settings_.password);
    }

    connect(client_, &QMqttClient::connected, this, &MqttTransport::onConnected);
    connect(client_, &QMqttClient::disconnected, this, &MqttTransport::onDisconnected);
    connect(client_, &QMqttClient::errorChanged, this, &MqttTransport::onErrorChanged);
}

MqttTransport::~MqttTransport()
{
    for (auto& sub : subscriptions_)
        disconnect(sub.connection);
    if (client_->state() != QMqttClient::Disconnected)
        client_->disconnectFromHost();
}

void MqttTransport::connectToBroker()
{
    BOOST_LOG_TRIVIAL(info) << "[MqttTransport] Connecting to "
                            << settings_.host.toStdString() << ":" << settings_.port
                            << " as " << settings_.clientId.toStdString();
    client_->connectToHost();
}

void MqttTransport::disconnectFromBroker()
{
    if (client_->state() == QMqttClient::Disconnected)
        return;
    client_->disconnectFromHost();
}

int MqttTransport::subscribe(const QString& topic, MessageHandler handler, quint8 qos)
{
    QMqttTopicFilter filter(topic);
    if (!filter.isValid() || !handler) {
        BOOST_LOG_TRIVIAL(warning) << "[MqttTransport] Refusing subscription to invalid topic '"
                                   << topic.toStdString() << "'";
        return -1;
    }

    int id = nextId_++;
    Subscription& sub = subscriptions_[id];
    sub.topic = topic;
    sub.handler = std::move(handler);
    sub.qos = qos;

    if (isConnected())
        activate(id, sub);
    else
        BOOST_LOG_TRIVIAL(debug) << "[MqttTransport] Deferring subscription to "
                                 << topic.toStdString() << " until connected";
    return id;
}

void MqttTransport::unsubscribe(int subscriptionId)
{
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end())
        return;

    const QString topic = it->topic;
    disconnect(it->connection);
    subscriptions_.erase(it);

    if (isConnected() && !topicStillWanted(topic)) {
        BOOST_LOG_TRIVIAL(debug) << "[MqttTransport] Unsubscribing from " << topic.toStdString();
        client_->unsubscribe(QMqttTopicFilter(topic));
    }
}

bool MqttTransport::publish(const QString& topic, const QByteArray& payload, quint8 qos)
{
    if (!isConnected()) {
        BOOST_LOG_TRIVIAL(warning) << "[MqttTransport] publish DROPPED (not connected): "
                                   << topic.toStdString();
        return false;
    }

    qint32 messageId = client_->publish(QMqttTopicName(topic), payload, qos, false);
    if (messageId == -1) {
        BOOST_LOG_TRIVIAL(warning) << "[MqttTransport] publish failed: " << topic.toStdString();
        return false;
    }
    return true;
}

bool MqttTransport::isConnected() const
{
    return client_->state() == QMqttClient::Connected;
}

void MqttTransport::onConnected()
{
    BOOST_LOG_TRIVIAL(info) << "[MqttTransport] Connected, restoring "
                            << subscriptions_.size() << " subscription(s)";
    for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it)
        activate(it.key(), it.value());
    emit connected();
}

void MqttTransport::onDisconnected()
{
    BOOST_LOG_TRIVIAL(warning) << "[MqttTransport] Disconnected from broker";
    for (auto& sub : subscriptions_) {
        disconnect(sub.connection);
        sub.handle.clear();
    }
    emit disconnected();
}

void MqttTransport::onErrorChanged(QMqttClient::ClientError clientError)
{
    if (clientError == QMqttClient::NoError)
        return;

    QString message = QStringLiteral("MQTT client error %1").arg(static_cast<int>(clientError));
    BOOST_LOG_TRIVIAL(error) << "[MqttTransport] " << message.toStdString();
    emit error(message);
}

void MqttTransport::activate(int subscriptionId, Subscription& sub)
{
    if (sub.handle)
        return;

    QMqttSubscription* handle = client_->subscribe(QMqttTopicFilter(sub.topic), sub.qos);
    if (!handle) {
        BOOST_LOG_TRIVIAL(error) << "[MqttTransport] subscribe failed: " << sub.topic.toStdString();
        return;
    }

    sub.handle = handle;
    sub.connection = connect(handle, &QMqttSubscription::messageReceived, this,
        [this, subscriptionId](const QMqttMessage& msg) {
            auto it = subscriptions_.find(subscriptionId);
            if (it == subscriptions_.end())
                return;
            // Copy: the handler may unsubscribe itself
            MessageHandler handler = it->handler;
            handler(msg.topic().name(), msg.payload());
        });
}

bool MqttTransport::topicStillWanted(const QString& topic) const
{
    for (const auto& sub : subscriptions_) {
        if (sub.topic == topic)
            return true;
    }
    return false;
}

} // namespace ham

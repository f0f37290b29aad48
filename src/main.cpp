#include <signal.h>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>
#include <ham/Transport/MqttTransport.hpp>
#include <ham/Version.hpp>
#include "core/BridgeHost.hpp"
#include "core/DeviceRegistry.hpp"
#include "core/Logging.hpp"
#include "core/MediaSourceResolver.hpp"
#include "core/ThumbnailStore.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/ServiceCallRegistry.hpp"
#include "core/services/StateRegistry.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("hass-agent-bridge");
    app.setApplicationVersion(QString("%1.%2").arg(ham::LIBRARY_MAJOR).arg(ham::LIBRARY_MINOR));

    // Config path from the first argument, else the per-user default
    const QStringList args = app.arguments();
    QString configPath = args.size() > 1
        ? args.at(1)
        : QDir::homePath() + "/.hass-agent-bridge/config.yaml";

    hab::YamlConfig config;
    if (QFile::exists(configPath)) {
        if (!config.load(configPath))
            return 1;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "No config at " << configPath.toStdString()
                                   << ", using defaults";
    }
    hab::applyLogLevel(config.logLevel());

    // --- Device registry ---
    hab::DeviceRegistry registry;
    int deviceCount = registry.loadFrom(config);
    BOOST_LOG_TRIVIAL(info) << "Loaded " << deviceCount << " device(s)";

    // --- MQTT transport ---
    ham::MqttSettings settings;
    settings.host = config.mqttHost();
    settings.port = config.mqttPort();
    settings.username = config.mqttUsername();
    settings.password = config.mqttPassword();
    settings.clientId = config.mqttClientId();
    settings.keepAliveSeconds = config.mqttKeepAlive();
    auto transport = new ham::MqttTransport(settings, &app);

    // --- Host collaborators ---
    auto thumbnails = new hab::ThumbnailStore(&app);
    hab::MediaSourceResolver resolver(config.baseUrl());
    auto states = new hab::StateRegistry(&app);
    auto services = new hab::ServiceCallRegistry(&app);

    states->subscribe(QString(), [](const QString& entityId, const QVariantMap& attributes) {
        BOOST_LOG_TRIVIAL(debug) << entityId.toStdString() << " -> "
                                 << attributes.value("state").toString().toStdString();
    });

    // --- Entities ---
    auto host = new hab::BridgeHost(registry, transport, thumbnails, &resolver,
                                    states, services, &app);
    QStringList entries = config.entries();
    if (entries.isEmpty()) {
        for (const auto& device : registry.devices())
            entries.append(device.uniqueId);
    }
    if (host->setupEntries(entries) == 0)
        BOOST_LOG_TRIVIAL(warning) << "No media players configured";

    transport->connectToBroker();

    static QCoreApplication* g_app = &app;
    auto requestQuit = [](int) {
        QMetaObject::invokeMethod(g_app, []() { QCoreApplication::quit(); },
                                  Qt::QueuedConnection);
    };
    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    int ret = app.exec();

    // Entities unsubscribe before the transport goes away
    host->unloadAll();
    transport->disconnectFromBroker();

    return ret;
}

#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <yaml-cpp/yaml.h>

namespace hab {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merge the file over the built-in defaults. On a parse error the
    /// defaults stay in place and false is returned.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // MQTT broker
    QString mqttHost() const;
    void setMqttHost(const QString& v);
    uint16_t mqttPort() const;
    void setMqttPort(uint16_t v);
    QString mqttUsername() const;
    void setMqttUsername(const QString& v);
    QString mqttPassword() const;
    void setMqttPassword(const QString& v);
    QString mqttClientId() const;
    void setMqttClientId(const QString& v);
    uint16_t mqttKeepAlive() const;
    void setMqttKeepAlive(uint16_t v);

    // Home Assistant
    QString baseUrl() const;
    void setBaseUrl(const QString& v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Devices - each device is a QVariantMap with
    // {unique_id, name, manufacturer, model, sw_version, entry_id}
    QList<QVariantMap> devices() const;
    void setDevices(const QList<QVariantMap>& devices);

    // Entries to instantiate. Empty when the file names none.
    QStringList entries() const;
    void setEntries(const QStringList& uniqueIds);

    // Generic dot-path access (e.g. "mqtt.host")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace hab

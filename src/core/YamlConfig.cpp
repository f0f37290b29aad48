#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace hab {

namespace {

// Maps merge key by key, anything else in the overlay replaces the base.
YAML::Node mergeOver(const YAML::Node& defaults, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(defaults);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        merged[key] = merged[key] ? mergeOver(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

QString stringOr(const YAML::Node& node, const char* fallback)
{
    if (!node.IsDefined() || !node.IsScalar())
        return QString::fromUtf8(fallback);
    return QString::fromStdString(node.Scalar());
}

QVariant scalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());
    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool ok = false;
    int i = s.toInt(&ok);
    if (ok) return QVariant(i);
    double d = s.toDouble(&ok);
    if (ok) return QVariant(d);

    return QVariant(s);
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["mqtt"]["host"] = "localhost";
    root_["mqtt"]["port"] = 1883;
    root_["mqtt"]["username"] = "";
    root_["mqtt"]["password"] = "";
    root_["mqtt"]["client_id"] = "hass-agent-bridge";
    root_["mqtt"]["keep_alive"] = 60;

    root_["homeassistant"]["base_url"] = "http://localhost:8123";

    root_["logging"]["level"] = "info";

    root_["devices"] = YAML::Node(YAML::NodeType::Sequence);
    root_["entries"] = YAML::Node(YAML::NodeType::Sequence);
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    const YAML::Node defaults = YAML::Clone(root_);

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeOver(defaults, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Failed to load "
                                 << filePath.toStdString() << ": " << e.what();
        root_ = defaults;
        return false;
    }
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "[YamlConfig] Cannot write " << filePath.toStdString();
        return false;
    }
    fout << root_;
    return true;
}

// --- MQTT ---

QString YamlConfig::mqttHost() const
{
    return stringOr(root_["mqtt"]["host"], "localhost");
}

void YamlConfig::setMqttHost(const QString& v)
{
    root_["mqtt"]["host"] = v.toStdString();
}

uint16_t YamlConfig::mqttPort() const
{
    return root_["mqtt"]["port"].as<uint16_t>(1883);
}

void YamlConfig::setMqttPort(uint16_t v)
{
    root_["mqtt"]["port"] = v;
}

QString YamlConfig::mqttUsername() const
{
    return stringOr(root_["mqtt"]["username"], "");
}

void YamlConfig::setMqttUsername(const QString& v)
{
    root_["mqtt"]["username"] = v.toStdString();
}

QString YamlConfig::mqttPassword() const
{
    return stringOr(root_["mqtt"]["password"], "");
}

void YamlConfig::setMqttPassword(const QString& v)
{
    root_["mqtt"]["password"] = v.toStdString();
}

QString YamlConfig::mqttClientId() const
{
    return stringOr(root_["mqtt"]["client_id"], "hass-agent-bridge");
}

void YamlConfig::setMqttClientId(const QString& v)
{
    root_["mqtt"]["client_id"] = v.toStdString();
}

uint16_t YamlConfig::mqttKeepAlive() const
{
    return root_["mqtt"]["keep_alive"].as<uint16_t>(60);
}

void YamlConfig::setMqttKeepAlive(uint16_t v)
{
    root_["mqtt"]["keep_alive"] = v;
}

// --- Home Assistant ---

QString YamlConfig::baseUrl() const
{
    return stringOr(root_["homeassistant"]["base_url"], "http://localhost:8123");
}

void YamlConfig::setBaseUrl(const QString& v)
{
    root_["homeassistant"]["base_url"] = v.toStdString();
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return stringOr(root_["logging"]["level"], "info");
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Devices ---

QList<QVariantMap> YamlConfig::devices() const
{
    static const char* const keys[] = {
        "unique_id", "name", "manufacturer", "model", "sw_version", "entry_id"};

    QList<QVariantMap> result;
    const YAML::Node list = root_["devices"];
    if (!list.IsSequence())
        return result;

    for (const auto& node : list) {
        if (!node.IsMap())
            continue;
        QVariantMap device;
        for (const char* key : keys) {
            const YAML::Node value = node[key];
            if (value.IsDefined() && value.IsScalar())
                device[key] = QString::fromStdString(value.Scalar());
        }
        result.append(device);
    }
    return result;
}

void YamlConfig::setDevices(const QList<QVariantMap>& devices)
{
    root_["devices"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& device : devices) {
        YAML::Node node(YAML::NodeType::Map);
        for (auto it = device.constBegin(); it != device.constEnd(); ++it)
            node[it.key().toStdString()] = it.value().toString().toStdString();
        root_["devices"].push_back(node);
    }
}

QStringList YamlConfig::entries() const
{
    QStringList result;
    if (root_["entries"].IsSequence()) {
        for (const auto& node : root_["entries"]) {
            if (node.IsScalar())
                result.append(QString::fromStdString(node.Scalar()));
        }
    }
    return result;
}

void YamlConfig::setEntries(const QStringList& uniqueIds)
{
    root_["entries"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& id : uniqueIds)
        root_["entries"].push_back(id.toStdString());
}

// --- Generic dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    return scalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only scalar leaves that exist in the defaults are writable
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (!defaults.IsScalar()) return false;
    }

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
        node[leaf] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leaf] = value.toDouble();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace hab

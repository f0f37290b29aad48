#pragma once

#include <ham/Host/IDeviceRegistry.hpp>
#include <QHash>

namespace hab {

class YamlConfig;

/// Device registry populated from the `devices` section of the config.
class DeviceRegistry : public ham::IDeviceRegistry {
public:
    DeviceRegistry() = default;

    /// Replace the registry contents. Entries without a unique id or name
    /// are skipped with a warning. Returns the number of devices loaded.
    int loadFrom(const YamlConfig& config);

    void addDevice(const ham::DeviceInfo& info);

    ham::DeviceInfo device(const QString& uniqueId) const override;
    QList<ham::DeviceInfo> devices() const override;

private:
    QHash<QString, ham::DeviceInfo> devices_;
    QStringList order_;
};

} // namespace hab

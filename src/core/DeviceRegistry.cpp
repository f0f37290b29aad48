#include "core/DeviceRegistry.hpp"
#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>

namespace hab {

int DeviceRegistry::loadFrom(const YamlConfig& config)
{
    devices_.clear();
    order_.clear();

    for (const auto& entry : config.devices()) {
        ham::DeviceInfo info;
        info.uniqueId = entry.value("unique_id").toString();
        info.name = entry.value("name").toString();
        info.manufacturer = entry.value("manufacturer").toString();
        info.model = entry.value("model").toString();
        info.swVersion = entry.value("sw_version").toString();
        info.entryId = entry.value("entry_id", info.uniqueId).toString();
        info.identifiers = {info.uniqueId};

        if (!info.isValid()) {
            BOOST_LOG_TRIVIAL(warning) << "[DeviceRegistry] Skipping device without unique_id or name";
            continue;
        }
        addDevice(info);
    }
    return devices_.size();
}

void DeviceRegistry::addDevice(const ham::DeviceInfo& info)
{
    if (!devices_.contains(info.uniqueId))
        order_.append(info.uniqueId);
    devices_[info.uniqueId] = info;
}

ham::DeviceInfo DeviceRegistry::device(const QString& uniqueId) const
{
    return devices_.value(uniqueId);
}

QList<ham::DeviceInfo> DeviceRegistry::devices() const
{
    QList<ham::DeviceInfo> result;
    for (const auto& id : order_)
        result.append(devices_.value(id));
    return result;
}

} // namespace hab

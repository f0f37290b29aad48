#pragma once

#include <QList>
#include <QString>
#include <QStringList>

namespace ham {

/// Registry entry describing one agent device.
struct DeviceInfo {
    QString uniqueId;       // registry identifier, also the config entry unique id
    QString entryId;        // config entry id; keys per-entry data such as thumbnails
    QStringList identifiers;
    QString name;           // display name, used verbatim in topic names
    QString manufacturer;
    QString model;
    QString swVersion;

    bool isValid() const { return !uniqueId.isEmpty() && !name.isEmpty(); }
};

class IDeviceRegistry {
public:
    virtual ~IDeviceRegistry() = default;

    /// Look up a device by unique id. Returns an invalid DeviceInfo if unknown.
    virtual DeviceInfo device(const QString& uniqueId) const = 0;

    virtual QList<DeviceInfo> devices() const = 0;
};

} // namespace ham

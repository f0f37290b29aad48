#pragma once

#include <QByteArray>
#include <QString>

namespace ham {

/// Receives raw thumbnail images for the host's image endpoint.
class IThumbnailSink {
public:
    virtual ~IThumbnailSink() = default;

    /// Replace the stored image for a config entry. Bytes are opaque.
    virtual void storeThumbnail(const QString& entryId, const QByteArray& image) = 0;

    /// Path (without query) under which the host serves an entity's image,
    /// e.g. /api/hass_agent/<entityId>/thumbnail.png
    virtual QString thumbnailPath(const QString& entityId) const = 0;
};

} // namespace ham

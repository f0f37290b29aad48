#include "core/ThumbnailStore.hpp"
#include <boost/log/trivial.hpp>

namespace hab {

ThumbnailStore::ThumbnailStore(QObject* parent) : QObject(parent) {}

void ThumbnailStore::storeThumbnail(const QString& entryId, const QByteArray& image)
{
    images_[entryId] = image;
    BOOST_LOG_TRIVIAL(trace) << "[ThumbnailStore] " << entryId.toStdString()
                             << ": " << image.size() << " bytes";
    emit thumbnailStored(entryId);
}

QString ThumbnailStore::thumbnailPath(const QString& entityId) const
{
    return QStringLiteral("/api/hass_agent/%1/thumbnail.png").arg(entityId);
}

QByteArray ThumbnailStore::thumbnail(const QString& entryId) const
{
    return images_.value(entryId);
}

bool ThumbnailStore::hasThumbnail(const QString& entryId) const
{
    return images_.contains(entryId);
}

} // namespace hab

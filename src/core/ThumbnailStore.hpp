#pragma once

#include <ham/Host/IThumbnailSink.hpp>
#include <QHash>
#include <QObject>

namespace hab {

/// In-memory thumbnail storage, one image per config entry.
class ThumbnailStore : public QObject, public ham::IThumbnailSink {
    Q_OBJECT
public:
    explicit ThumbnailStore(QObject* parent = nullptr);

    void storeThumbnail(const QString& entryId, const QByteArray& image) override;
    QString thumbnailPath(const QString& entityId) const override;

    QByteArray thumbnail(const QString& entryId) const;
    bool hasThumbnail(const QString& entryId) const;

signals:
    void thumbnailStored(const QString& entryId);

private:
    QHash<QString, QByteArray> images_;
};

} // namespace hab

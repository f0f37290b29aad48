#include "core/MediaSourceResolver.hpp"
#include <QMimeDatabase>
#include <boost/log/trivial.hpp>

namespace hab {

namespace {
const QString kScheme = QStringLiteral("media-source://");
const QString kLocalSource = QStringLiteral("media-source://media_source/");
}

MediaSourceResolver::MediaSourceResolver(const QString& baseUrl)
    : baseUrl_(baseUrl)
{
    while (baseUrl_.endsWith('/'))
        baseUrl_.chop(1);
}

bool MediaSourceResolver::isMediaSourceId(const QString& mediaId) const
{
    return mediaId.startsWith(kScheme);
}

ham::ResolvedMedia MediaSourceResolver::resolve(const QString& mediaId, const QString& entityId)
{
    if (!mediaId.startsWith(kLocalSource)) {
        BOOST_LOG_TRIVIAL(warning) << "[MediaSourceResolver] Unsupported source "
                                   << mediaId.toStdString() << " for " << entityId.toStdString();
        return {};
    }

    const QString path = mediaId.mid(kLocalSource.size());
    if (path.isEmpty() || path.split('/').contains(QStringLiteral(".."))) {
        BOOST_LOG_TRIVIAL(warning) << "[MediaSourceResolver] Invalid path in "
                                   << mediaId.toStdString();
        return {};
    }

    ham::ResolvedMedia resolved;
    resolved.url = QStringLiteral("/media/") + path;
    resolved.mimeType = QMimeDatabase().mimeTypeForFile(path, QMimeDatabase::MatchExtension).name();
    return resolved;
}

QString MediaSourceResolver::processPlayMediaUrl(const QString& url) const
{
    if (url.startsWith('/'))
        return baseUrl_ + url;
    return url;
}

} // namespace hab

#pragma once

#include <ham/Host/IMediaResolver.hpp>

namespace hab {

/// Resolves local media-source references against the Home Assistant
/// media directory and makes relative URLs absolute against `baseUrl`.
///
/// media-source://media_source/<dir>/<path> -> /media/<dir>/<path>
class MediaSourceResolver : public ham::IMediaResolver {
public:
    explicit MediaSourceResolver(const QString& baseUrl);

    bool isMediaSourceId(const QString& mediaId) const override;
    ham::ResolvedMedia resolve(const QString& mediaId, const QString& entityId) override;
    QString processPlayMediaUrl(const QString& url) const override;

private:
    QString baseUrl_;
};

} // namespace hab

#pragma once

#include <QString>

namespace ham {

struct ResolvedMedia {
    QString url;
    QString mimeType;

    bool isValid() const { return !url.isEmpty(); }
};

/// Turns indirect media references into URLs the agent can fetch.
class IMediaResolver {
public:
    virtual ~IMediaResolver() = default;

    /// True for indirect references (media-source://...).
    virtual bool isMediaSourceId(const QString& mediaId) const = 0;

    /// Resolve an indirect reference on behalf of `entityId`.
    /// Returns an invalid ResolvedMedia when the reference cannot be resolved.
    virtual ResolvedMedia resolve(const QString& mediaId, const QString& entityId) = 0;

    /// Make a direct URL playable by a remote device (relative paths become
    /// absolute against the host's external URL).
    virtual QString processPlayMediaUrl(const QString& url) const = 0;
};

} // namespace ham

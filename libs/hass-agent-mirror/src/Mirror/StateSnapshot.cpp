#include <ham/Mirror/StateSnapshot.hpp>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QtGlobal>

namespace ham {

namespace {

StateSnapshot fail(QString* error, const QString& reason)
{
    if (error)
        *error = reason;
    return {};
}

QString optionalString(const QJsonObject& obj, const char* key)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isString() ? v.toString() : QString();
}

bool optionalNumber(const QJsonObject& obj, const char* key, double& out)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isDouble())
        return false;
    out = v.toDouble();
    return true;
}

} // namespace

StateSnapshot StateSnapshot::fromJson(const QByteArray& payload, QString* error)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError)
        return fail(error, QStringLiteral("invalid JSON: %1").arg(err.errorString()));
    if (!doc.isObject())
        return fail(error, QStringLiteral("payload is not a JSON object"));

    const QJsonObject obj = doc.object();
    const QJsonValue state = obj.value(QLatin1String("state"));
    const QJsonValue volume = obj.value(QLatin1String("volume"));
    const QJsonValue muted = obj.value(QLatin1String("muted"));

    if (!state.isString())
        return fail(error, QStringLiteral("missing or non-string 'state'"));
    if (!volume.isDouble())
        return fail(error, QStringLiteral("missing or non-numeric 'volume'"));
    if (!muted.isBool())
        return fail(error, QStringLiteral("missing or non-boolean 'muted'"));

    StateSnapshot s;
    s.state = state.toString();
    s.volume = qRound(qBound(0.0, volume.toDouble(), 100.0));
    s.muted = muted.toBool();

    s.title = optionalString(obj, "title");
    s.artist = optionalString(obj, "artist");
    s.albumTitle = optionalString(obj, "albumtitle");
    s.albumArtist = optionalString(obj, "albumartist");
    s.hasDuration = optionalNumber(obj, "duration", s.duration);
    s.hasCurrentPosition = optionalNumber(obj, "currentposition", s.currentPosition);

    s.valid = true;
    return s;
}

} // namespace ham

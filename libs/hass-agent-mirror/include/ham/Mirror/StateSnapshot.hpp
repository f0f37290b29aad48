#pragma once

#include <QByteArray>
#include <QString>

namespace ham {

/// One decoded state report from the agent's state topic.
struct StateSnapshot {
    // Required
    QString state;
    int volume = 0;
    bool muted = false;

    // Optional: null and absent are treated alike
    QString title;
    QString artist;
    QString albumTitle;
    QString albumArtist;
    double duration = 0.0;
    bool hasDuration = false;
    double currentPosition = 0.0;
    bool hasCurrentPosition = false;

    bool valid = false;

    bool isValid() const { return valid; }

    /// Decode a state topic payload. Returns a snapshot with isValid() == false
    /// when the payload is not a JSON object or a required field is missing or
    /// has the wrong type; `error` then receives the reason.
    static StateSnapshot fromJson(const QByteArray& payload, QString* error = nullptr);
};

} // namespace ham

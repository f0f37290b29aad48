#pragma once

#include <QString>

namespace ham {

/// Fixed topic layout used by the agent: hass.agent/media_player/{device}/...
/// Device names are used verbatim (case-sensitive).
struct AgentTopics {
    QString state;
    QString thumbnail;
    QString command;

    static AgentTopics forDevice(const QString& deviceName);
};

} // namespace ham

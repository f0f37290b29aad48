#include <ham/Mirror/Topics.hpp>
#include <ham/Version.hpp>

namespace ham {

AgentTopics AgentTopics::forDevice(const QString& deviceName)
{
    const QString base = QStringLiteral("%1/%2").arg(QLatin1String(TOPIC_ROOT), deviceName);

    AgentTopics t;
    t.state = base + QStringLiteral("/state");
    t.thumbnail = base + QStringLiteral("/thumbnail");
    t.command = base + QStringLiteral("/cmd");
    return t;
}

} // namespace ham

#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace hab {

bool applyLogLevel(const QString& level)
{
    namespace logging = boost::log;

    const std::string name = level.trimmed().toLower().toStdString();
    logging::trivial::severity_level severity = logging::trivial::info;
    const bool known = logging::trivial::from_string(name.c_str(), name.size(), severity);
    if (!known)
        severity = logging::trivial::info;

    logging::core::get()->set_filter(logging::trivial::severity >= severity);

    if (!known) {
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level '" << name
                                   << "', using info";
    }
    return known;
}

} // namespace hab

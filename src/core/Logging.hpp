#pragma once

#include <QString>

namespace hab {

/// Set the minimum severity of the trivial logger from a level name
/// (trace, debug, info, warning, error, fatal). Unknown names fall back to
/// info and return false.
bool applyLogLevel(const QString& level);

} // namespace hab

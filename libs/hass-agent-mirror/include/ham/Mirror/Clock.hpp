#pragma once

#include <QDateTime>
#include <functional>

namespace ham {

/// Wall-clock source. Tests substitute a settable clock.
using Clock = std::function<QDateTime()>;

inline QDateTime systemNow()
{
    return QDateTime::currentDateTimeUtc();
}

} // namespace ham

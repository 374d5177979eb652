#include "core/shared/clock.h"

#include <QDateTime>

#include <utility>

namespace ss {

int64_t systemClockMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

ClockFn clockOrDefault(ClockFn clock)
{
    if (clock) {
        return clock;
    }
    return &systemClockMs;
}

} // namespace ss

#include "ScrollCoupling.h"

#include <cmath>

namespace pflow {

double speedMetresPerSecond(double speed_kph) {
    return speed_kph / kKphPerMps;
}

double flowDistanceZ(double speed_kph, double dt_s, double time_scale) {
    return speedMetresPerSecond(speed_kph) * dt_s * time_scale;
}

double roadOffsetDelta(double speed_kph, double dt_s, double time_scale) {
    return flowDistanceZ(speed_kph, dt_s, time_scale) / kLaneMeters;
}

double wrapRoadOffset(double offset) {
    if (!std::isfinite(offset)) {
        return 0.0;
    }
    double w = offset - std::floor(offset);
    // floor() of values just below an integer can round w up to 1.0.
    if (w >= 1.0) w = 0.0;
    return w;
}

} // namespace pflow

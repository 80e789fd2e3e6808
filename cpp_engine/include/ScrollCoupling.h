#pragma once

namespace pflow {

// Real-world length covered by one repeat of the road texture (meters).
constexpr double kLaneMeters = 10.0;

constexpr double kKphPerMps = 3.6;

double speedMetresPerSecond(double speed_kph);

// Distance (m) the world moves past the vehicle this frame. Trail samples are
// displaced backwards (+Z) by this amount.
double flowDistanceZ(double speed_kph, double dt_s, double time_scale);

// Road texture offset increment in texture repeats. The caller accumulates it;
// no modulo is applied here.
double roadOffsetDelta(double speed_kph, double dt_s, double time_scale);

// Fractional part in [0, 1). Returns 0 for non-finite input.
double wrapRoadOffset(double offset);

} // namespace pflow

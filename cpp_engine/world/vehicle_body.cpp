#include "vehicle_body.h"

#include <algorithm>
#include <cmath>

namespace pflow {
namespace world {

static inline std::uint32_t xorshift32(std::uint32_t& s) {
    s ^= (s << 13);
    s ^= (s >> 17);
    s ^= (s << 5);
    return s;
}

void VehicleBody::reseed() {
    // xorshift32 has a fixed point at 0.
    rng_state_u32_ = (cfg_.jitter_seed_u32 != 0u) ? cfg_.jitter_seed_u32 : 0x9E3779B9u;
}

double VehicleBody::nextUnit() {
    // [0,1)
    return static_cast<double>(xorshift32(rng_state_u32_)) / 4294967296.0; // 2^32
}

double VehicleBody::scaleZForCylinders(int cylinder_count, double reference_cylinders) {
    if (cylinder_count < 1 || !(reference_cylinders > 0.0)) {
        return 1.0;
    }
    return std::max(1.0, static_cast<double>(cylinder_count) / reference_cylinders);
}

void VehicleBody::recompute(const Inputs& in) {
    valid_ = false;

    if (in.cylinder_count < 1) return;
    if (!std::isfinite(in.rpm)) return;

    pose_.scale_z = scaleZForCylinders(in.cylinder_count, cfg_.reference_cylinders);

    pose_.half_extent_m.x = 0.5 * cfg_.size_x_m;
    pose_.half_extent_m.y = 0.5 * cfg_.size_y_m;
    pose_.half_extent_m.z = 0.5 * cfg_.size_z_m * pose_.scale_z;

    pose_.vibration_m = Point3{};
    if (in.rpm > 0.0) {
        const double rpm_0_1 = in.rpm / kRpmFullScale;
        const double u = nextUnit();
        const double v = nextUnit();
        pose_.vibration_m.x = (u - 0.5) * kJitterX_m * rpm_0_1;
        pose_.vibration_m.y = (v - 0.5) * kJitterY_m * rpm_0_1;
    }

    pose_.center_m.x = pose_.vibration_m.x;
    pose_.center_m.y = cfg_.center_y_m + pose_.vibration_m.y;
    pose_.center_m.z = 0.0;

    valid_ = true;
}

} // namespace world
} // namespace pflow

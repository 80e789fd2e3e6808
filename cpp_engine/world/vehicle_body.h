#pragma once

// world/vehicle_body.h
//
// Symbolic car body around the engine, plus the RPM-driven vibration jitter.
//
// The jitter is a presentation-layer effect. Its only contract is the bound
//   |dx| <= 0.5 * kJitterX_m * rpm / kRpmFullScale
//   |dy| <= 0.5 * kJitterY_m * rpm / kRpmFullScale
// and exactly zero at rpm <= 0. The random source is a seeded xorshift32, so
// a given seed replays the same sequence (no std::rand()).

#include "../include/Point3.h"

#include <cstdint>

namespace pflow {
namespace world {

class VehicleBody {
public:
    static constexpr double kRpmFullScale = 8000.0;
    static constexpr double kJitterX_m = 0.02;
    static constexpr double kJitterY_m = 0.01;

    struct Config {
        double size_x_m = 4.5;
        double size_y_m = 3.0;
        double size_z_m = 10.0;
        double center_y_m = 0.5;

        // Cylinder count that the unscaled body length fits.
        double reference_cylinders = 4.0;

        std::uint32_t jitter_seed_u32 = 0x2545F491u;
    };

    struct Inputs {
        int cylinder_count = 4;
        double rpm = 0.0;
    };

    struct Pose {
        // Resting center plus vibration.
        Point3 center_m{};
        Point3 half_extent_m{};

        double scale_z = 1.0;
        Point3 vibration_m{};
    };

    VehicleBody() { reseed(); }
    explicit VehicleBody(const Config& cfg) : cfg_(cfg) { reseed(); }

    const Config& config() const { return cfg_; }

    // Restart the jitter sequence from config().jitter_seed_u32.
    void reseed();

    // Draws one jitter sample per call (one per frame).
    void recompute(const Inputs& in);

    bool isValid() const { return valid_; }
    const Pose& pose() const { return pose_; }

    static double scaleZForCylinders(int cylinder_count, double reference_cylinders);

private:
    double nextUnit();

    Config cfg_ {};
    Pose pose_ {};
    std::uint32_t rng_state_u32_ = 0u;
    bool valid_ = false;
};

} // namespace world
} // namespace pflow

#pragma once

#include <cmath>
#include <vector>

namespace pflow {

// ============================================================
// Piston kinematics (stylized sinusoid, not a crank-slider model)
//
// Units:
//   - angles in radians, angular velocity in rad/s
//   - offsets in meters along the cylinder axis (Y up)
//   - rpm in revolutions per minute
// ============================================================

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

constexpr double kStrokeLength_m = 1.0;

// Above the knee, rpm is compressed 10:1 before it drives the crank. A 60 Hz
// display resolves at most 30 rev/s (1800 rpm); past that the pistons would
// appear to slow down or run backwards.
constexpr double kVisualRpmKnee = 1000.0;
constexpr double kVisualRpmCompression = 0.1;

struct CylinderSpec {
    int index = 0;
    double phase_rad = 0.0;
};

struct PistonState {
    CylinderSpec cylinder{};
    double axial_offset_m = 0.0;
};

// Phases 2*pi*i/count for i in [0, count). Empty for count < 1.
std::vector<CylinderSpec> buildCylinders(int cylinder_count);

double visualRpm(double rpm);

// rad/s for the remapped rpm.
double angularVelocity(double rpm);

// Returns crank_angle + angularVelocity(rpm) * dt_s * time_scale.
// rpm and time_scale are expected clamped to >= 0 by the caller.
double advanceCrankAngle(double crank_angle_rad, double rpm, double dt_s, double time_scale);

inline double pistonOffset(double crank_angle_rad, double phase_rad) {
    return 0.5 * kStrokeLength_m * std::sin(crank_angle_rad + phase_rad);
}

// One offset per cylinder, same order as `cylinders`.
std::vector<double> computeOffsets(double crank_angle_rad, const std::vector<CylinderSpec>& cylinders);

// Allocation-free variant for the frame loop; pistons[i].cylinder must already be set.
void updatePistons(double crank_angle_rad, std::vector<PistonState>& pistons);

} // namespace pflow

#include "EngineKinematics.h"

namespace pflow {

std::vector<CylinderSpec> buildCylinders(int cylinder_count) {
    std::vector<CylinderSpec> out;
    if (cylinder_count < 1) {
        return out;
    }

    out.reserve(static_cast<std::size_t>(cylinder_count));
    for (int i = 0; i < cylinder_count; ++i) {
        CylinderSpec c;
        c.index = i;
        // Even spacing over one revolution; cylinder 0 is exactly 0.
        c.phase_rad = (static_cast<double>(i) * kTwoPi) / static_cast<double>(cylinder_count);
        out.push_back(c);
    }
    return out;
}

double visualRpm(double rpm) {
    if (rpm <= kVisualRpmKnee) {
        return rpm;
    }
    return kVisualRpmKnee + (rpm - kVisualRpmKnee) * kVisualRpmCompression;
}

double angularVelocity(double rpm) {
    return (visualRpm(rpm) * kTwoPi) / 60.0;
}

double advanceCrankAngle(double crank_angle_rad, double rpm, double dt_s, double time_scale) {
    return crank_angle_rad + angularVelocity(rpm) * dt_s * time_scale;
}

std::vector<double> computeOffsets(double crank_angle_rad, const std::vector<CylinderSpec>& cylinders) {
    std::vector<double> offsets;
    offsets.reserve(cylinders.size());
    for (const CylinderSpec& c : cylinders) {
        offsets.push_back(pistonOffset(crank_angle_rad, c.phase_rad));
    }
    return offsets;
}

void updatePistons(double crank_angle_rad, std::vector<PistonState>& pistons) {
    for (PistonState& p : pistons) {
        p.axial_offset_m = pistonOffset(crank_angle_rad, p.cylinder.phase_rad);
    }
}

} // namespace pflow

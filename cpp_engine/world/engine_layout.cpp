// world/engine_layout.cpp
//
// Implementation notes:
//   - Cylinder placement and part sizes follow the scene the visualizer draws:
//       * z_i = start_z + i * spacing, start_z = -(count-1) * spacing / 2
//       * block is (2.0, 2.5, total_length + 2.0), centered at the origin
//       * crank journal at (0, -1.5, z_i)
//   - Trails are seeded from piston_rest_m, so a rebuild never shows a streak
//     before the first frame.

#include "engine_layout.h"

#include <cmath>

namespace pflow {
namespace world {

static constexpr double kMinSpacing = 1e-9;

static inline Point3 make_p3(double x, double y, double z) {
    Point3 out;
    out.x = x;
    out.y = y;
    out.z = z;
    return out;
}

void EngineLayout::recompute(int cylinder_count) {
    valid_ = false;
    geo_ = EngineLayoutGeometry{};

    if (cylinder_count < 1) {
        return;
    }
    if (!std::isfinite(cfg_.cylinder_spacing_m) || cfg_.cylinder_spacing_m <= kMinSpacing) {
        return;
    }

    const double total_length_m = static_cast<double>(cylinder_count - 1) * cfg_.cylinder_spacing_m;
    if (std::isnan(cfg_.max_total_length_m) || total_length_m > cfg_.max_total_length_m) {
        return;
    }

    const std::size_t n = static_cast<std::size_t>(cylinder_count);
    geo_.cylinder_count = cylinder_count;
    geo_.total_length_m = total_length_m;

    const double start_z = -0.5 * geo_.total_length_m;

    geo_.cylinder_z_m.reserve(n);
    geo_.piston_rest_m.reserve(n);
    geo_.crank_center_m.reserve(n);

    for (int i = 0; i < cylinder_count; ++i) {
        const double z = start_z + static_cast<double>(i) * cfg_.cylinder_spacing_m;
        geo_.cylinder_z_m.push_back(z);
        geo_.piston_rest_m.push_back(make_p3(0.0, cfg_.piston_base_y_m, z));
        geo_.crank_center_m.push_back(make_p3(0.0, cfg_.crank_y_m, z));
    }

    geo_.block_center_m = make_p3(0.0, 0.0, 0.0);
    geo_.block_half_m = make_p3(0.5 * cfg_.block_size_x_m,
                                0.5 * cfg_.block_size_y_m,
                                0.5 * (geo_.total_length_m + cfg_.block_end_margin_m));

    valid_ = true;
}

Point3 EngineLayout::restPosition(int i) const {
    if (!valid_ || i < 0 || i >= geo_.cylinder_count) {
        return Point3{};
    }
    return geo_.piston_rest_m[static_cast<std::size_t>(i)];
}

Point3 EngineLayout::pistonPosition(int i, double axial_offset_m) const {
    Point3 p = restPosition(i);
    if (!valid_ || i < 0 || i >= geo_.cylinder_count) {
        return p;
    }
    p.y += axial_offset_m;
    return p;
}

} // namespace world
} // namespace pflow

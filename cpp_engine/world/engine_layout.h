#pragma once

// world/engine_layout.h
//
// Inline engine geometry: where each cylinder sits, where its piston rests,
// and the boxes/cylinders the visualizer draws around it.
//
// Design goals:
//   - No ImGui / ImPlot / OpenGL dependencies.
//   - Deterministic geometry driven by the cylinder count only.
//   - Resting points here seed the trail buffers on every rebuild.
//
// Coordinate convention (matches vis/main_vis.cpp):
//   - Y is up; the crank axis runs along Z.
//   - Cylinders are spaced evenly along Z and centered on Z = 0:
//       z_i = -(count - 1) * spacing / 2 + i * spacing
//   - A piston at rest sits at (0, piston_base_y_m, z_i); its axial offset
//     is added to Y.

#include "../include/Point3.h"

#include <limits>
#include <vector>

namespace pflow {
namespace world {

struct EngineLayoutConfig {
    double cylinder_spacing_m = 1.2;

    double piston_base_y_m = 0.0;
    double piston_radius_m = 0.4;
    double piston_height_m = 0.6;

    // Connecting rod box, centered rod_drop_m below the piston head.
    double rod_width_m  = 0.1;
    double rod_length_m = 1.5;
    double rod_drop_m   = 1.0;

    // Crank journal (cylinder along X) below each bore.
    double crank_y_m      = -1.5;
    double crank_radius_m = 0.1;
    double crank_width_m  = 0.2;

    // Block box: fixed X/Y size, Z = engine length + block_end_margin_m.
    double block_size_x_m = 2.0;
    double block_size_y_m = 2.5;
    double block_end_margin_m = 2.0;

    // Bay the engine must fit in: layouts with total_length_m above this are
    // invalid. Infinite = no limit.
    double max_total_length_m = std::numeric_limits<double>::infinity();
};

struct EngineLayoutGeometry {
    int cylinder_count = 0;

    // (count - 1) * spacing; 0 for a single cylinder.
    double total_length_m = 0.0;

    // Per cylinder, index order.
    std::vector<double> cylinder_z_m;
    std::vector<Point3> piston_rest_m;
    std::vector<Point3> crank_center_m;

    Point3 block_center_m{};
    Point3 block_half_m{};
};

class EngineLayout {
public:
    EngineLayout() = default;
    explicit EngineLayout(const EngineLayoutConfig& cfg) : cfg_(cfg) {}

    void setConfig(const EngineLayoutConfig& cfg) { cfg_ = cfg; }
    const EngineLayoutConfig& config() const { return cfg_; }

    // Rebuild all per-cylinder geometry. count < 1, a non-positive spacing or an
    // engine longer than max_total_length_m leaves the layout invalid with
    // empty arrays.
    void recompute(int cylinder_count);

    bool isValid() const { return valid_; }
    const EngineLayoutGeometry& geometry() const { return geo_; }

    // World position of piston i for a given axial offset.
    // If invalid or i is out of range, returns {0,0,0}.
    Point3 pistonPosition(int i, double axial_offset_m) const;

    // Resting position of piston i (offset 0). Same fallback as above.
    Point3 restPosition(int i) const;

private:
    EngineLayoutConfig cfg_ {};
    EngineLayoutGeometry geo_ {};
    bool valid_ = false;
};

} // namespace world
} // namespace pflow

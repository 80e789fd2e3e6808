#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "EngineKinematics.h"
#include "Point3.h"
#include "ScrollCoupling.h"
#include "TrailBuffer.h"

#include "../world/engine_layout.h"
#include "../world/vehicle_body.h"

namespace pflow {

// ============================================================
// Parameter boundary
//
// The core assumes sanitized numbers. Everything coming from the UI, CLI or a
// test goes through sanitizeParameters() first; a NaN that slips past it
// would poison the crank angle and every trail until the next rebuild.
// ============================================================

struct ParameterLimits {
    static constexpr int kMinCylinders = 1;
    static constexpr int kMaxCylinders = 12;
    static constexpr double kMaxRpm = 8000.0;
    static constexpr double kMaxSpeedKph = 300.0;
    static constexpr double kMaxTimeScale = 3.0;
};

// Result bits of a parameter change (developer-visible; never fatal).
enum ParamStatusBits : std::uint32_t {
    Param_None              = 0u,
    Param_Clamped           = 1u << 0, // negative / over-range value pulled into range
    Param_RejectedNonFinite = 1u << 1, // NaN/Inf field ignored, previous value kept
    Param_Rebuilt           = 1u << 2, // cylinder set, pistons and trails reallocated
    Param_RebuildFailed     = 1u << 3, // allocation failed; previous engine kept
};

struct EngineParameters {
    int cylinder_count = 4;
    double rpm = 1000.0;
    double speed_kph = 50.0;
    double time_scale = 1.0;
};

// Versioned, hashable snapshot of the effective parameters.
struct EngineConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(EngineConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::int32_t cylinder_count_i32 = 0;
    double rpm = 0.0;
    double speed_kph = 0.0;
    double time_scale = 0.0;

    // Derived, for audit only.
    double visual_rpm = 0.0;
    double angular_velocity_radps = 0.0;
};

// Field-by-field: non-finite -> keep `previous` (Param_RejectedNonFinite),
// otherwise clamp into ParameterLimits (Param_Clamped if anything moved).
// `status_bits` may be null.
EngineParameters sanitizeParameters(const EngineParameters& requested,
                                    const EngineParameters& previous,
                                    std::uint32_t* status_bits);

// What the renderer pulls after each frame. Fixed-size, no allocation.
struct FrameSnapshot {
    static constexpr int kMaxCylinders = ParameterLimits::kMaxCylinders;

    std::uint64_t frame_index_u64 = 0;
    std::uint32_t generation_u32 = 0;

    // Scaled simulation time (sum of dt * time_scale).
    double time_s = 0.0;

    double crank_angle_rad = 0.0;
    double visual_rpm = 0.0;
    double angular_velocity_radps = 0.0;

    // Last frame's increments.
    double flow_dz_m = 0.0;
    double road_offset_delta = 0.0;

    // Unwrapped accumulator (texture repeats).
    double road_offset = 0.0;

    EngineParameters params{};

    int cylinder_count = 0;
    std::array<double, kMaxCylinders> piston_offset_m{};
    std::array<Point3, kMaxCylinders> piston_pos_m{};

    Point3 body_center_m{};
    Point3 body_vibration_m{};
    double body_scale_z = 1.0;
};

class EngineSimulation {
public:
    EngineSimulation();
    explicit EngineSimulation(const EngineParameters& initial);

    EngineSimulation(const EngineSimulation&) = delete;
    EngineSimulation& operator=(const EngineSimulation&) = delete;

    // Trails are handed out by pointer to the renderer; keep the context pinned.
    EngineSimulation(EngineSimulation&&) = delete;
    EngineSimulation& operator=(EngineSimulation&&) = delete;

    // Input boundary. Returns ParamStatusBits.
    std::uint32_t setParameters(const EngineParameters& requested);
    std::uint32_t setCylinderCount(int cylinder_count);
    std::uint32_t setRpm(double rpm);
    std::uint32_t setSpeedKph(double speed_kph);
    std::uint32_t setTimeScale(double time_scale);

    const EngineParameters& parameters() const { return params_; }

    // Replaces the engine geometry and rebuilds the current cylinder set.
    // An invalid layout (see EngineLayout::recompute) reports
    // Param_RebuildFailed and keeps the previous layout and engine.
    std::uint32_t setLayoutConfig(const world::EngineLayoutConfig& cfg);

    // dt must be finite and >= 0; invalid dt is ignored.
    void step(double dt_s);

    // Zero crank angle, road offset, time and frame index; reseed trails at
    // rest. Parameters and cylinder set are kept.
    void restart();

    // Must be side-effect free.
    FrameSnapshot observe() const;

    const std::vector<CylinderSpec>& cylinders() const { return cylinders_; }
    const std::vector<PistonState>& pistons() const { return pistons_; }

    int trailCount() const { return static_cast<int>(trails_.size()); }
    // nullptr when i is out of range.
    const TrailBuffer* trail(int i) const;
    void clearTrailDirty(int i);

    const world::EngineLayout& layout() const { return layout_; }
    const world::VehicleBody& body() const { return body_; }

    double crankAngle_rad() const noexcept { return crank_angle_rad_; }
    double roadOffset() const noexcept { return road_offset_; }
    double time_s() const noexcept { return time_s_; }
    std::uint64_t frameIndex() const noexcept { return frame_index_u64_; }

    // Incremented by every successful rebuild.
    std::uint32_t generation() const noexcept { return generation_u32_; }

    // FNV-1a32 over the effective parameters.
    std::uint32_t runParamHash() const noexcept { return run_param_hash_u32_; }
    EngineConfigV1 config() const;

    // FNV-1a32 over frame index, time, crank angle, road offset, piston offsets
    // and every trail sample. Equal state gives equal digests.
    std::uint32_t stateDigest() const;

    // key=value lines; returns the length that would be written (snprintf rules).
    int exportConfigText(char* buf, int cap) const;

private:
    // All-or-nothing: builds into locals and swaps on success.
    bool rebuild(const world::EngineLayoutConfig& layout_cfg, int cylinder_count);
    void refreshParamHash();
    void refreshBodyAtRest();

    EngineParameters params_{};

    world::EngineLayout layout_{};
    world::VehicleBody body_{};

    std::vector<CylinderSpec> cylinders_;
    std::vector<PistonState> pistons_;
    std::vector<TrailBuffer> trails_;

    double crank_angle_rad_ = 0.0;
    double road_offset_ = 0.0;
    double time_s_ = 0.0;
    std::uint64_t frame_index_u64_ = 0;

    double last_flow_dz_m_ = 0.0;
    double last_road_delta_ = 0.0;

    std::uint32_t generation_u32_ = 0;
    std::uint32_t run_param_hash_u32_ = 0;
};

} // namespace pflow

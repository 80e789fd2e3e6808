// Simulation.cpp
// Notes:
// - step() is allocation-free: trails are fixed arrays, piston/trail vectors
//   are only resized inside rebuild().
// - rebuild() is the only place that can fail (invalid layout or
//   std::bad_alloc); it commits with swaps so a failed attempt leaves the
//   previous engine untouched.

#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <new>

namespace pflow {

namespace {

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_u64(std::uint32_t h, std::uint64_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static inline void sanitizeScalar(double requested, double previous, double hi,
                                  double& out, std::uint32_t& status) {
    if (!std::isfinite(requested)) {
        out = previous;
        status |= Param_RejectedNonFinite;
        return;
    }
    out = std::clamp(requested, 0.0, hi);
    if (out != requested) {
        status |= Param_Clamped;
    }
}

} // namespace

EngineParameters sanitizeParameters(const EngineParameters& requested,
                                    const EngineParameters& previous,
                                    std::uint32_t* status_bits) {
    std::uint32_t status = Param_None;
    EngineParameters out = previous;

    out.cylinder_count = std::clamp(requested.cylinder_count,
                                    ParameterLimits::kMinCylinders,
                                    ParameterLimits::kMaxCylinders);
    if (out.cylinder_count != requested.cylinder_count) {
        status |= Param_Clamped;
    }

    sanitizeScalar(requested.rpm,        previous.rpm,        ParameterLimits::kMaxRpm,       out.rpm,        status);
    sanitizeScalar(requested.speed_kph,  previous.speed_kph,  ParameterLimits::kMaxSpeedKph,  out.speed_kph,  status);
    sanitizeScalar(requested.time_scale, previous.time_scale, ParameterLimits::kMaxTimeScale, out.time_scale, status);

    if (status_bits) {
        *status_bits = status;
    }
    return out;
}

EngineSimulation::EngineSimulation()
    : EngineSimulation(EngineParameters{}) {}

EngineSimulation::EngineSimulation(const EngineParameters& initial) {
    // Defaults are always valid, so the boundary can fall back to them.
    params_ = sanitizeParameters(initial, EngineParameters{}, nullptr);

    // A sanitized count always lays out; the only failure left is allocation,
    // and there is no previous engine to keep.
    if (!rebuild(layout_.config(), params_.cylinder_count)) {
        throw std::bad_alloc();
    }
    refreshParamHash();
    refreshBodyAtRest();
}

bool EngineSimulation::rebuild(const world::EngineLayoutConfig& layout_cfg, int cylinder_count) {
    try {
        world::EngineLayout layout;
        layout.setConfig(layout_cfg);
        layout.recompute(cylinder_count);
        if (!layout.isValid()) {
            return false;
        }

        std::vector<CylinderSpec> cylinders = buildCylinders(cylinder_count);
        const std::size_t n = cylinders.size();

        std::vector<PistonState> pistons;
        pistons.reserve(n);
        std::vector<TrailBuffer> trails;
        trails.reserve(n);

        for (std::size_t i = 0; i < n; ++i) {
            PistonState p;
            p.cylinder = cylinders[i];
            p.axial_offset_m = pistonOffset(crank_angle_rad_, p.cylinder.phase_rad);
            pistons.push_back(p);

            // No stale streak: every sample starts at the resting point.
            trails.emplace_back(layout.restPosition(static_cast<int>(i)));
        }

        // Commit. Nothing below can throw.
        layout_ = std::move(layout);
        cylinders_.swap(cylinders);
        pistons_.swap(pistons);
        trails_.swap(trails);
        ++generation_u32_;
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::uint32_t EngineSimulation::setParameters(const EngineParameters& requested) {
    std::uint32_t status = Param_None;
    EngineParameters next = sanitizeParameters(requested, params_, &status);

    if (next.cylinder_count != params_.cylinder_count) {
        if (rebuild(layout_.config(), next.cylinder_count)) {
            status |= Param_Rebuilt;
        } else {
            status |= Param_RebuildFailed;
            next.cylinder_count = params_.cylinder_count;
        }
    }

    params_ = next;
    refreshParamHash();
    return status;
}

std::uint32_t EngineSimulation::setLayoutConfig(const world::EngineLayoutConfig& cfg) {
    if (!rebuild(cfg, params_.cylinder_count)) {
        return Param_RebuildFailed;
    }
    return Param_Rebuilt;
}

std::uint32_t EngineSimulation::setCylinderCount(int cylinder_count) {
    EngineParameters p = params_;
    p.cylinder_count = cylinder_count;
    return setParameters(p);
}

std::uint32_t EngineSimulation::setRpm(double rpm) {
    EngineParameters p = params_;
    p.rpm = rpm;
    return setParameters(p);
}

std::uint32_t EngineSimulation::setSpeedKph(double speed_kph) {
    EngineParameters p = params_;
    p.speed_kph = speed_kph;
    return setParameters(p);
}

std::uint32_t EngineSimulation::setTimeScale(double time_scale) {
    EngineParameters p = params_;
    p.time_scale = time_scale;
    return setParameters(p);
}

void EngineSimulation::step(double dt_s) {
    if (!std::isfinite(dt_s) || dt_s < 0.0) {
        return;
    }

    const double ts = params_.time_scale;

    // 1) Crank + pistons.
    crank_angle_rad_ = advanceCrankAngle(crank_angle_rad_, params_.rpm, dt_s, ts);
    updatePistons(crank_angle_rad_, pistons_);

    // 2) Trails: age by this frame's flow, then feed each piston's head point.
    last_flow_dz_m_ = flowDistanceZ(params_.speed_kph, dt_s, ts);
    const std::size_t n = std::min(pistons_.size(), trails_.size());
    for (std::size_t i = 0; i < n; ++i) {
        const Point3 head = layout_.pistonPosition(static_cast<int>(i), pistons_[i].axial_offset_m);
        trails_[i].advance(head, last_flow_dz_m_);
    }

    // 3) Road.
    last_road_delta_ = roadOffsetDelta(params_.speed_kph, dt_s, ts);
    road_offset_ += last_road_delta_;

    // 4) Presentation-only body jitter.
    world::VehicleBody::Inputs body_in;
    body_in.cylinder_count = params_.cylinder_count;
    body_in.rpm = params_.rpm;
    body_.recompute(body_in);

    time_s_ += dt_s * ts;
    ++frame_index_u64_;
}

void EngineSimulation::restart() {
    crank_angle_rad_ = 0.0;
    road_offset_ = 0.0;
    time_s_ = 0.0;
    frame_index_u64_ = 0;
    last_flow_dz_m_ = 0.0;
    last_road_delta_ = 0.0;

    updatePistons(crank_angle_rad_, pistons_);
    for (std::size_t i = 0; i < trails_.size(); ++i) {
        trails_[i].reset(layout_.restPosition(static_cast<int>(i)));
    }

    body_.reseed();
    refreshBodyAtRest();
}

void EngineSimulation::refreshBodyAtRest() {
    // rpm 0 draws no jitter sample, so the seed sequence is untouched.
    world::VehicleBody::Inputs body_in;
    body_in.cylinder_count = params_.cylinder_count;
    body_in.rpm = 0.0;
    body_.recompute(body_in);
}

const TrailBuffer* EngineSimulation::trail(int i) const {
    if (i < 0 || i >= trailCount()) {
        return nullptr;
    }
    return &trails_[static_cast<std::size_t>(i)];
}

void EngineSimulation::clearTrailDirty(int i) {
    if (i < 0 || i >= trailCount()) {
        return;
    }
    trails_[static_cast<std::size_t>(i)].clearDirty();
}

FrameSnapshot EngineSimulation::observe() const {
    FrameSnapshot s;
    s.frame_index_u64 = frame_index_u64_;
    s.generation_u32 = generation_u32_;
    s.time_s = time_s_;

    s.crank_angle_rad = crank_angle_rad_;
    s.visual_rpm = visualRpm(params_.rpm);
    s.angular_velocity_radps = angularVelocity(params_.rpm);

    s.flow_dz_m = last_flow_dz_m_;
    s.road_offset_delta = last_road_delta_;
    s.road_offset = road_offset_;

    s.params = params_;

    const int n = std::min(static_cast<int>(pistons_.size()), FrameSnapshot::kMaxCylinders);
    s.cylinder_count = n;
    for (int i = 0; i < n; ++i) {
        const double off = pistons_[static_cast<std::size_t>(i)].axial_offset_m;
        s.piston_offset_m[static_cast<std::size_t>(i)] = off;
        s.piston_pos_m[static_cast<std::size_t>(i)] = layout_.pistonPosition(i, off);
    }

    if (body_.isValid()) {
        s.body_center_m = body_.pose().center_m;
        s.body_vibration_m = body_.pose().vibration_m;
        s.body_scale_z = body_.pose().scale_z;
    }
    return s;
}

EngineConfigV1 EngineSimulation::config() const {
    EngineConfigV1 c;
    c.cylinder_count_i32 = static_cast<std::int32_t>(params_.cylinder_count);
    c.rpm = params_.rpm;
    c.speed_kph = params_.speed_kph;
    c.time_scale = params_.time_scale;
    c.visual_rpm = visualRpm(params_.rpm);
    c.angular_velocity_radps = angularVelocity(params_.rpm);
    c.fnv_hash_u32 = run_param_hash_u32_;
    return c;
}

void EngineSimulation::refreshParamHash() {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, 1u); // EngineConfigV1 version
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(params_.cylinder_count));
    h = fnv1a32_add_f64(h, params_.rpm);
    h = fnv1a32_add_f64(h, params_.speed_kph);
    h = fnv1a32_add_f64(h, params_.time_scale);
    run_param_hash_u32_ = h;
}

std::uint32_t EngineSimulation::stateDigest() const {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u64(h, frame_index_u64_);
    h = fnv1a32_add_f64(h, time_s_);
    h = fnv1a32_add_f64(h, crank_angle_rad_);
    h = fnv1a32_add_f64(h, road_offset_);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(pistons_.size()));

    for (const PistonState& p : pistons_) {
        h = fnv1a32_add_f64(h, p.axial_offset_m);
    }
    for (const TrailBuffer& t : trails_) {
        for (int k = 0; k < TrailBuffer::kLength; ++k) {
            const Point3 q = t.at(k);
            h = fnv1a32_add_f64(h, q.x);
            h = fnv1a32_add_f64(h, q.y);
            h = fnv1a32_add_f64(h, q.z);
        }
    }
    return h;
}

int EngineSimulation::exportConfigText(char* buf, int cap) const {
    const EngineConfigV1 c = config();
    char tmp[512];
    const int n = std::snprintf(tmp, sizeof(tmp),
        "version=%u\n"
        "cylinder_count=%d\n"
        "rpm=%.6f\n"
        "speed_kph=%.6f\n"
        "time_scale=%.6f\n"
        "visual_rpm=%.6f\n"
        "angular_velocity_radps=%.6f\n"
        "trail_length=%d\n"
        "lane_meters=%.6f\n"
        "param_hash=0x%08X\n",
        static_cast<unsigned>(c.version_u32),
        static_cast<int>(c.cylinder_count_i32),
        c.rpm,
        c.speed_kph,
        c.time_scale,
        c.visual_rpm,
        c.angular_velocity_radps,
        TrailBuffer::kLength,
        kLaneMeters,
        static_cast<unsigned>(c.fnv_hash_u32));

    if (n < 0) {
        if (buf && cap > 0) buf[0] = '\0';
        return 0;
    }
    if (buf && cap > 0) {
        const int copy_n = std::min(n, cap - 1);
        std::memcpy(buf, tmp, static_cast<std::size_t>(copy_n));
        buf[copy_n] = '\0';
    }
    return n;
}

} // namespace pflow

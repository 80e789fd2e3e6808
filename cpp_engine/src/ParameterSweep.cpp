#include "ParameterSweep.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace pflow {

ParameterSweep::ParameterSweep() = default;

void ParameterSweep::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void ParameterSweep::clearResults() {
    results_.clear();
}

std::vector<double> ParameterSweep::sampleValues(const ParameterRange& range) {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

int ParameterSweep::frameCount(const ScenarioConfig& scenario) {
    if (!std::isfinite(scenario.dt_s) || scenario.dt_s <= 0.0) return 0;
    if (!std::isfinite(scenario.t_end_s) || scenario.t_end_s < 0.0) return 0;

    const double n = std::floor(scenario.t_end_s / scenario.dt_s + 1e-9);
    if (!std::isfinite(n) || n > static_cast<double>(kMaxFrames)) return 0;
    return static_cast<int>(n);
}

ParameterSweep::SampleResult ParameterSweep::runScenario(const ScenarioConfig& scenario) const {
    EngineSimulation sim;
    SampleResult m{};
    m.param_status_u32 = sim.setParameters(scenario.base);

    const FrameSnapshot first = sim.observe();
    m.visual_rpm = first.visual_rpm;
    m.angular_velocity_radps = first.angular_velocity_radps;

    const int frames = frameCount(scenario);
    for (int f = 0; f < frames; ++f) {
        const double crank_before = sim.crankAngle_rad();
        sim.step(scenario.dt_s);
        ++m.frames;

        const FrameSnapshot o = sim.observe();
        m.crank_advance_per_frame_rad = o.crank_angle_rad - crank_before;
        m.flow_per_frame_m = o.flow_dz_m;
        for (int i = 0; i < o.cylinder_count; ++i) {
            m.peak_abs_offset_m = std::max(m.peak_abs_offset_m,
                                           std::abs(o.piston_offset_m[static_cast<std::size_t>(i)]));
        }
    }

    m.final_crank_angle_rad = sim.crankAngle_rad();
    m.final_road_offset = sim.roadOffset();

    if (const TrailBuffer* tb = sim.trail(0)) {
        m.trail0_z_span_m = tb->at(TrailBuffer::kLength - 1).z - tb->at(0).z;
    }
    return m;
}

void ParameterSweep::sweepRpm(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.base.rpm = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"rpm", value, metrics});
    }
}

void ParameterSweep::sweepSpeed(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.base.speed_kph = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"speed_kph", value, metrics});
    }
}

void ParameterSweep::sweepTimeScale(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.base.time_scale = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"time_scale", value, metrics});
    }
}

void ParameterSweep::sweepCylinders(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        if (!std::isfinite(value)) {
            continue;
        }
        const double clamped = std::clamp(value,
                                          static_cast<double>(ParameterLimits::kMinCylinders),
                                          static_cast<double>(ParameterLimits::kMaxCylinders));
        const int count = static_cast<int>(std::lround(clamped));
        ScenarioConfig scenario = scenario_;
        scenario.base.cylinder_count = count;
        const auto metrics = runScenario(scenario);
        results_.push_back({"cylinder_count", static_cast<double>(count), metrics});
    }
}

bool ParameterSweep::exportCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,frames,visual_rpm,angular_velocity_radps,crank_advance_per_frame_rad,"
           "flow_per_frame_m,final_crank_angle_rad,final_road_offset,peak_abs_offset_m,"
           "trail0_z_span_m,param_status\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.frames << ','
            << row.metrics.visual_rpm << ','
            << row.metrics.angular_velocity_radps << ','
            << row.metrics.crank_advance_per_frame_rad << ','
            << row.metrics.flow_per_frame_m << ','
            << row.metrics.final_crank_angle_rad << ','
            << row.metrics.final_road_offset << ','
            << row.metrics.peak_abs_offset_m << ','
            << row.metrics.trail0_z_span_m << ','
            << row.metrics.param_status_u32 << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<ParameterSweep::SweepRow>& ParameterSweep::results() const {
    return results_;
}

} // namespace pflow

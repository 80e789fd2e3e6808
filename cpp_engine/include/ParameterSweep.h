#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Simulation.h"

namespace pflow {

// Headless fixed-timer driver: one fresh EngineSimulation per sample value,
// stepped at dt_s until t_end_s, with per-run metrics collected for CSV.
class ParameterSweep {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        double dt_s = 1.0 / 60.0;
        double t_end_s = 5.0;
        EngineParameters base{};
    };

    struct SampleResult {
        int frames = 0;
        double visual_rpm = 0.0;
        double angular_velocity_radps = 0.0;
        double crank_advance_per_frame_rad = 0.0;
        double flow_per_frame_m = 0.0;
        double final_crank_angle_rad = 0.0;
        double final_road_offset = 0.0;
        double peak_abs_offset_m = 0.0;
        // at(kLength-1).z - at(0).z of trail 0 at the end of the run.
        double trail0_z_span_m = 0.0;
        std::uint32_t param_status_u32 = 0;
    };

    struct SweepRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    // Upper bound on frames per run; longer scenarios run zero frames.
    static constexpr int kMaxFrames = 10'000'000;

    ParameterSweep();

    void setScenario(const ScenarioConfig& scenario);
    const ScenarioConfig& scenario() const { return scenario_; }
    void clearResults();

    void sweepRpm(const ParameterRange& range);
    void sweepSpeed(const ParameterRange& range);
    void sweepTimeScale(const ParameterRange& range);
    // Sample values are clamped to [1, 12] and rounded; non-finite samples are skipped.
    void sweepCylinders(const ParameterRange& range);

    // Returns false if the file cannot be opened.
    bool exportCSV(const std::string& filename) const;
    const std::vector<SweepRow>& results() const;

    // Linearly spaced in [min, max]; {nominal} if samples <= 1 or max <= min.
    static std::vector<double> sampleValues(const ParameterRange& range);

    // floor(t_end_s / dt_s); 0 for non-finite or non-positive dt, non-finite or
    // negative t_end, or more than kMaxFrames.
    static int frameCount(const ScenarioConfig& scenario);

    SampleResult runScenario(const ScenarioConfig& scenario) const;

private:
    ScenarioConfig scenario_{};
    std::vector<SweepRow> results_{};
};

} // namespace pflow

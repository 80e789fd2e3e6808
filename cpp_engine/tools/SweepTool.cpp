#include "ParameterSweep.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <rpm|speed|time_scale|cylinders> [--min v] [--max v] [--samples n]\n"
              << "            [--dt s] [--t-end s] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "engine_sweep.csv";
    bool min_set = false;
    bool max_set = false;

    pflow::ParameterSweep sweep;
    pflow::ParameterSweep::ScenarioConfig scenario;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--dt" && i + 1 < argc) {
                scenario.dt_s = std::stod(argv[++i]);
            } else if (arg == "--t-end" && i + 1 < argc) {
                scenario.t_end_s = std::stod(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cout << "Invalid numeric argument (" << e.what() << ")\n";
        printUsage();
        return 1;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    if (!std::isfinite(scenario.dt_s) || !(scenario.dt_s > 0.0) ||
        !std::isfinite(scenario.t_end_s) || !(scenario.t_end_s >= 0.0)) {
        std::cout << "--dt must be finite and > 0, --t-end must be finite and >= 0\n";
        printUsage();
        return 1;
    }
    if (scenario.t_end_s / scenario.dt_s > static_cast<double>(pflow::ParameterSweep::kMaxFrames)) {
        std::cout << "--t-end / --dt exceeds " << pflow::ParameterSweep::kMaxFrames << " frames\n";
        printUsage();
        return 1;
    }

    sweep.setScenario(scenario);

    pflow::ParameterSweep::ParameterRange range;
    range.samples = samples;

    if (param == "rpm") {
        range.nominal = scenario.base.rpm;
    } else if (param == "speed" || param == "speed_kph") {
        range.nominal = scenario.base.speed_kph;
    } else if (param == "time_scale" || param == "timescale") {
        range.nominal = scenario.base.time_scale;
    } else if (param == "cylinders" || param == "cylinder_count") {
        range.nominal = static_cast<double>(scenario.base.cylinder_count);
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    const bool is_cylinders = (param == "cylinders" || param == "cylinder_count");
    if (!min_set) {
        min_val = is_cylinders ? static_cast<double>(pflow::ParameterLimits::kMinCylinders)
                               : range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = is_cylinders ? static_cast<double>(pflow::ParameterLimits::kMaxCylinders)
                               : range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    if (param == "rpm") {
        sweep.sweepRpm(range);
    } else if (param == "speed" || param == "speed_kph") {
        sweep.sweepSpeed(range);
    } else if (is_cylinders) {
        sweep.sweepCylinders(range);
    } else {
        sweep.sweepTimeScale(range);
    }

    if (!sweep.exportCSV(out)) {
        std::cout << "Failed to write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote " << sweep.results().size() << " rows to: " << out << "\n";
    return 0;
}

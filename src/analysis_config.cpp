#include "analysis_config.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <omp.h>
#include <stdexcept>

namespace msd_fit {

void
AnalysisConfig::validate() const {
    if (!(time_step > 0.0)) { throw std::invalid_argument("time_step must be positive."); }
    if (!(micron_per_px > 0.0)) { throw std::invalid_argument("micron_per_px must be positive."); }
    if (min_track_len < 2) {
        throw std::invalid_argument("min_track_len must be at least 2 (got " + std::to_string(min_track_len) + ").");
    }
    if (tlag_cutoff < 1) {
        throw std::invalid_argument("tlag_cutoff must be at least 1 (got " + std::to_string(tlag_cutoff) + ").");
    }
    if (!(alpha_max > alpha_min_exclusive)) {
        throw std::invalid_argument("alpha range (" + std::to_string(alpha_min_exclusive) + ", " +
                                    std::to_string(alpha_max) + "] is empty.");
    }
    if (alpha_clamp_tolerance < 0.0) { throw std::invalid_argument("alpha_clamp_tolerance cannot be negative."); }
    if (max_solver_iterations < 1) { throw std::invalid_argument("max_solver_iterations must be at least 1."); }
    if (function_tolerance <= 0.0 || gradient_tolerance <= 0.0 || parameter_tolerance <= 0.0) {
        throw std::invalid_argument("Solver tolerances must be positive.");
    }
}

int
ParallelismOptions::resolved_threads_per_replicate() const {
    if (threads_per_replicate > 0) { return threads_per_replicate; }
    int const jobs = std::max(1, replicate_jobs);
    return std::max(1, omp_get_num_procs() / jobs);
}

namespace {

template<typename T>
void
read_optional(const nlohmann::json &j, const char *key, T &target) {
    auto it = j.find(key);
    if (it == j.end()) { return; }
    try {
        target = it->template get<T>();
    } catch (const nlohmann::json::exception &e) {
        throw std::invalid_argument(std::string("Config key '") + key + "' has the wrong type: " + e.what());
    }
}

} // namespace

AnalysisConfig
analysis_config_from_json(const nlohmann::json &j) {
    if (!j.is_object()) { throw std::invalid_argument("Analysis config must be a JSON object."); }

    AnalysisConfig config;
    read_optional(j, "time_step", config.time_step);
    read_optional(j, "micron_per_px", config.micron_per_px);
    read_optional(j, "min_track_len", config.min_track_len);
    read_optional(j, "tlag_cutoff", config.tlag_cutoff);
    read_optional(j, "alpha_min_exclusive", config.alpha_min_exclusive);
    read_optional(j, "alpha_max", config.alpha_max);
    read_optional(j, "alpha_clamp_tolerance", config.alpha_clamp_tolerance);
    read_optional(j, "max_solver_iterations", config.max_solver_iterations);
    read_optional(j, "function_tolerance", config.function_tolerance);
    read_optional(j, "gradient_tolerance", config.gradient_tolerance);
    read_optional(j, "parameter_tolerance", config.parameter_tolerance);
    read_optional(j, "export_step_sizes", config.export_step_sizes);
    read_optional(j, "verbose", config.verbose);
    return config;
}

nlohmann::json
analysis_config_to_json(const AnalysisConfig &config) {
    return nlohmann::json{ { "time_step", config.time_step },
                           { "micron_per_px", config.micron_per_px },
                           { "min_track_len", config.min_track_len },
                           { "tlag_cutoff", config.tlag_cutoff },
                           { "alpha_min_exclusive", config.alpha_min_exclusive },
                           { "alpha_max", config.alpha_max },
                           { "alpha_clamp_tolerance", config.alpha_clamp_tolerance },
                           { "max_solver_iterations", config.max_solver_iterations },
                           { "function_tolerance", config.function_tolerance },
                           { "gradient_tolerance", config.gradient_tolerance },
                           { "parameter_tolerance", config.parameter_tolerance },
                           { "export_step_sizes", config.export_step_sizes },
                           { "verbose", config.verbose } };
}

AnalysisConfig
load_analysis_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) { throw std::runtime_error("Could not open analysis config file '" + path + "'."); }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("Failed to parse analysis config '" + path + "': " + e.what());
    }

    AnalysisConfig config = analysis_config_from_json(j);
    config.validate();
    std::cout << "[AnalysisConfig] Loaded " << path << ": time_step=" << config.time_step
              << " micron_per_px=" << config.micron_per_px << " min_track_len=" << config.min_track_len
              << " tlag_cutoff=" << config.tlag_cutoff << std::endl;
    return config;
}

void
write_params_log(const std::string &path, const AnalysisConfig &config, const ReplicateLabels &labels) {
    std::ofstream out(path);
    if (!out) { throw std::runtime_error("Could not open params log '" + path + "' for writing."); }

    nlohmann::json j;
    j["condition"] = labels.condition;
    j["replicate"] = labels.replicate;
    j["parameters"] = analysis_config_to_json(config);
    out << j.dump(4) << '\n';
}

} // namespace msd_fit

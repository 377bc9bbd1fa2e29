#include "msd_fit.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

// Analyzes one trajectory CSV and writes its result tables next to it.
//
//   csv_replicate Traj_<condition>_<n>.csv [config.json]
int
main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <Traj_condition_n.csv> [config.json]" << '\n';
        return 1;
    }
    std::filesystem::path const csv_path(argv[1]);

    try {
        msd_fit::AnalysisConfig config;
        if (argc > 2) { config = msd_fit::load_analysis_config(argv[2]); }
        config.validate();

        // Traj_wt_3.csv -> replicate "wt_3", condition "wt"
        std::string replicate = csv_path.stem().string();
        if (replicate.rfind("Traj_", 0) == 0) { replicate = replicate.substr(5); }
        std::string condition = replicate;
        auto const underscore = condition.find_last_of('_');
        if (underscore != std::string::npos && underscore + 1 < condition.size() &&
            std::isdigit(static_cast<unsigned char>(condition[underscore + 1]))) {
            condition = condition.substr(0, underscore);
        }
        msd_fit::ReplicateLabels const labels{ condition, replicate };

        auto const table = msd_fit::read_track_csv_file(csv_path.string());
        auto const store = msd_fit::build_track_store(table, config);
        msd_fit::ParallelismOptions const parallelism;
        auto const analysis =
          msd_fit::analyze_replicate(store, config, labels, parallelism.resolved_threads_per_replicate());

        std::filesystem::path const out_dir = csv_path.parent_path() / replicate;
        std::filesystem::create_directories(out_dir);
        msd_fit::write_params_log((out_dir / "params_log.json").string(), config, labels);

        std::ofstream results(out_dir / "msd_results.csv");
        msd_fit::write_fit_results_csv(results, analysis.fit_table);

        if (config.export_step_sizes) {
            std::ofstream steps(out_dir / "all_data_step_sizes.txt");
            msd_fit::write_step_table_tsv(steps, analysis.step_angles);
            std::ofstream angles(out_dir / "all_data_angles.txt");
            msd_fit::write_angle_table_tsv(angles, analysis.step_angles);
        }

        const auto &counts = analysis.fit_table.counts;
        std::cout << "Wrote " << counts.fitted << " fit(s) to " << (out_dir / "msd_results.csv") << " ("
                  << counts.failed << " failed, " << counts.excluded_short << " too short)." << '\n';
    } catch (const msd_fit::InputSchemaError &e) {
        std::cerr << "Input error: " << e.what() << '\n';
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}

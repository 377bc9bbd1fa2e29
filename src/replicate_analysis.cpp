#include "replicate_analysis.hpp"
#include "curve_fitter.hpp"

#include <algorithm>
#include <iostream>
#include <omp.h>
#include <sstream>
#include <utility>

namespace msd_fit {

ReplicateAnalysis
analyze_replicate(const TrackStore &store,
                  const AnalysisConfig &config,
                  const ReplicateLabels &labels,
                  int num_threads) {
    config.validate();
    CurveFitter const fitter(config);

    std::vector<MsdSeries> series = compute_msd_batch(store.tracks, config.tlag_cutoff, num_threads);

    auto const n = static_cast<long long>(store.tracks.size());
    std::vector<FitOutcome> outcomes(store.tracks.size());
    std::vector<StepAngleTable> per_track_steps(config.export_step_sizes ? store.tracks.size() : 0);

#pragma omp parallel for schedule(dynamic, 16) num_threads(std::max(1, num_threads))
    for (long long i = 0; i < n; ++i) {
        auto const idx = static_cast<std::size_t>(i);
        outcomes[idx] = fitter.fit(series[idx]);
        if (config.export_step_sizes) {
            extract_steps_and_angles(store.tracks[idx], config.tlag_cutoff, labels.condition, per_track_steps[idx]);
        }
    }

    ReplicateAnalysis analysis;
    FitResultAggregator aggregator(labels);
    aggregator.record_ingestion(store);
    for (std::size_t i = 0; i < store.tracks.size(); ++i) {
        aggregator.add(store.tracks[i].id, outcomes[i]);
        if (config.export_step_sizes) { analysis.step_angles.append(per_track_steps[i]); }
    }
    analysis.fit_table = aggregator.release();
    analysis.ensemble = ensemble_msd(series);

    const auto &counts = analysis.fit_table.counts;
    std::ostringstream msg;
    msg << "[ReplicateAnalysis] " << labels.condition << "/" << labels.replicate << ": " << counts.fitted
        << " fitted (" << counts.power_law << " power_law, " << counts.linear << " linear), " << counts.failed
        << " failed, " << counts.excluded_short << " excluded as too short.\n";
    std::cout << msg.str() << std::flush;
    if (counts.input_tracks > 0 && counts.fitted == 0) {
        std::cerr << "[ReplicateAnalysis] Warning: " + labels.replicate + " produced no fitted tracks.\n";
    }
    return analysis;
}

namespace {

ReplicateOutcome
run_one(const ReplicateInput &input, const AnalysisConfig &config, int threads) {
    ReplicateOutcome outcome;
    outcome.labels = input.labels;
    try {
        TrackTable loaded;
        const TrackTable *table = nullptr;
        if (input.table) {
            table = &*input.table;
        } else {
            loaded = read_track_csv_file(input.csv_path);
            table = &loaded;
        }
        TrackStore const store = input.positions_in_microns ? build_track_store_from_microns(*table, config)
                                                            : build_track_store(*table, config);
        outcome.analysis = analyze_replicate(store, config, input.labels, threads);
        outcome.ok = true;
    } catch (const InputSchemaError &e) {
        outcome.error = e.what();
        std::cerr << "[ReplicateRunner] Error: replicate " + input.labels.replicate + " failed: " + e.what() + "\n";
    } catch (const std::exception &e) {
        // exceptions must not leave the OpenMP region; the replicate is reported as failed
        outcome.error = input.labels.replicate + ": " + e.what();
        std::cerr << "[ReplicateRunner] Error: replicate " + input.labels.replicate + " failed: " + e.what() + "\n";
    }
    return outcome;
}

} // namespace

std::vector<ReplicateOutcome>
run_replicates(const std::vector<ReplicateInput> &inputs,
               const AnalysisConfig &config,
               const ParallelismOptions &parallelism) {
    config.validate();
    int const jobs = std::max(1, parallelism.replicate_jobs);
    int const threads = parallelism.resolved_threads_per_replicate();
    std::cout << "[ReplicateRunner] " << inputs.size() << " replicate(s), " << jobs << " job(s) x " << threads
              << " thread(s) per replicate." << std::endl;

    omp_set_max_active_levels(2);

    std::vector<ReplicateOutcome> outcomes(inputs.size());
    auto const n = static_cast<long long>(inputs.size());
#pragma omp parallel for schedule(dynamic, 1) num_threads(jobs)
    for (long long i = 0; i < n; ++i) {
        auto const idx = static_cast<std::size_t>(i);
        outcomes[idx] = run_one(inputs[idx], config, threads);
    }

    std::size_t const failed =
      std::count_if(outcomes.begin(), outcomes.end(), [](const ReplicateOutcome &o) { return !o.ok; });
    std::cout << "[ReplicateRunner] Finished: " << (outcomes.size() - failed) << " ok, " << failed << " failed."
              << std::endl;
    return outcomes;
}

} // namespace msd_fit

#include "photomosaic/pipeline/batch.hpp"
#include "photomosaic/core/parallel.hpp"

#include <algorithm>
#include <iostream>

namespace photomosaic::pipeline {

MosaicRequest make_request(const config::Config& cfg, const fs::path& source_path,
                           const fs::path& output_path, const std::string& run_id,
                           int workers) {
    MosaicRequest request;
    request.run_id = run_id;
    request.source_path = source_path;
    request.output_path = output_path;
    request.assignment.reuse = cfg.assignment.reuse;
    request.assignment.shuffle_first = cfg.assignment.shuffle_first;
    request.assignment.seed = cfg.assignment.seed;
    request.assignment.workers = std::max(1, workers);
    request.label_font_scale = cfg.output.label_font_scale;

    if (cfg.output.write_instructions) {
        const fs::path dir = output_path.parent_path() / cfg.output.instructions_dir;
        const std::string stem = output_path.stem().string();
        request.instructions_path = dir / (stem + ".png");
        if (cfg.output.instructions_json) {
            request.instructions_json_path = dir / (stem + ".json");
        }
    }
    return request;
}

std::vector<BatchJobResult> run_batch(const std::vector<fs::path>& sources,
                                      const fs::path& output_dir,
                                      const pool::TilePool& pool,
                                      const config::Config& cfg,
                                      core::EventEmitter& events,
                                      const std::string& batch_id,
                                      const core::CancellationToken* cancel) {
    std::vector<BatchJobResult> results(sources.size());

    const int jobs = std::max(1, cfg.runtime.parallel_jobs);
    // Split the ranking threads between concurrent jobs.
    const int workers_per_job = std::max(1, cfg.resolved_workers() / jobs);

    std::cerr << "[BATCH] " << sources.size() << " sources, " << jobs << " jobs x "
              << workers_per_job << " workers" << std::endl;

    core::parallel_for_index(sources.size(), jobs, [&](std::size_t i) {
        BatchJobResult& r = results[i];
        r.source_path = sources[i];

        if (core::stop_requested(cancel)) {
            r.skipped = true;
            r.error = "stop requested";
            return;
        }

        const std::string run_id = batch_id + "_" + sources[i].stem().string();
        const fs::path output_path = output_dir / sources[i].filename();
        const MosaicRequest request =
            make_request(cfg, sources[i], output_path, run_id, workers_per_job);

        try {
            r.summary = create_mosaic(request, pool, events, cancel);
            r.ok = true;
        } catch (const std::exception& e) {
            r.error = e.what();
            std::cerr << "[BATCH] " << sources[i].filename().string() << " failed: " << e.what()
                      << std::endl;
            events.error(run_id, e.what());
        }
    });

    const auto failed = std::count_if(results.begin(), results.end(), [](const BatchJobResult& r) {
        return !r.ok && !r.skipped;
    });
    std::cerr << "[BATCH] done: " << (static_cast<long>(results.size()) - failed)
              << " ok or skipped, " << failed << " failed" << std::endl;
    return results;
}

} // namespace photomosaic::pipeline

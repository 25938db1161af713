#pragma once

#include "photomosaic/config/configuration.hpp"
#include "photomosaic/core/cancellation.hpp"
#include "photomosaic/core/events.hpp"
#include "photomosaic/pipeline/mosaic_job.hpp"
#include "photomosaic/pool/tile_pool.hpp"

#include <string>
#include <vector>

namespace photomosaic::pipeline {

struct BatchJobResult {
    fs::path source_path;
    bool ok = false;
    bool skipped = false; // not started because a stop was requested
    std::string error;
    MosaicSummary summary;
};

// Request for one source image with output and instruction paths laid out
// from cfg.output: instructions go to <output dir>/<instructions_dir>/<stem>.
MosaicRequest make_request(const config::Config& cfg, const fs::path& source_path,
                           const fs::path& output_path, const std::string& run_id,
                           int workers);

/**
 * Builds one mosaic per source image into output_dir against a shared,
 * read-only pool. Up to runtime.parallel_jobs jobs run at once, each with its
 * own AssignmentEngine. A failing job is recorded in its result and the
 * remaining jobs continue. Results keep the order of sources.
 */
std::vector<BatchJobResult> run_batch(const std::vector<fs::path>& sources,
                                      const fs::path& output_dir,
                                      const pool::TilePool& pool,
                                      const config::Config& cfg,
                                      core::EventEmitter& events,
                                      const std::string& batch_id,
                                      const core::CancellationToken* cancel = nullptr);

} // namespace photomosaic::pipeline

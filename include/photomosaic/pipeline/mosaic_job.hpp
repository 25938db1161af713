#pragma once

#include "photomosaic/core/cancellation.hpp"
#include "photomosaic/core/events.hpp"
#include "photomosaic/core/types.hpp"
#include "photomosaic/pipeline/assignment.hpp"
#include "photomosaic/pipeline/build_instructions.hpp"
#include "photomosaic/pipeline/mosaic_canvas.hpp"
#include "photomosaic/pool/tile_pool.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace photomosaic::pipeline {

struct MosaicRequest {
    std::string run_id;
    fs::path source_path;
    fs::path output_path;
    fs::path instructions_path;      // empty: no diagram
    fs::path instructions_json_path; // empty: no JSON export
    AssignmentOptions assignment;
    double label_font_scale = 0.35;
};

struct MosaicSummary {
    std::string run_id;
    fs::path source_path;
    fs::path output_path;
    fs::path instructions_path;
    fs::path instructions_json_path;
    int x_tile_count = 0;
    int y_tile_count = 0;
    int cells_total = 0;
    int filled = 0;
    int skipped = 0;
    AssignmentStatus status = AssignmentStatus::COMPLETED;
};

// Places every record's tile on mosaic and adds it to instructions. A tile that
// does not fit its cell raises a warning event and is left out of both; the
// cell keeps its source pixels. Returns the number of skipped records.
int compose_records(MosaicCanvas& mosaic, BuildInstructions& instructions,
                    const std::vector<AssignmentRecord>& records,
                    const pool::TilePool& pool, core::EventEmitter& events,
                    const std::string& run_id);

/**
 * One complete mosaic: source canvas, ranking, assignment, composition and
 * the optional build instructions.
 *
 * The pool defines the geometry. The raster is written in every terminal
 * state, including pool exhaustion and cancellation. A tile that does not fit
 * its cell is reported as a warning and the cell keeps its source pixels.
 * ConfigError, IOError and SizeMismatchError from the canvas/pool check
 * propagate after a run_end event.
 */
MosaicSummary create_mosaic(const MosaicRequest& request, const pool::TilePool& pool,
                            core::EventEmitter& events,
                            const core::CancellationToken* cancel = nullptr);

// Same, with an already decoded source image. request.source_path is only
// reported.
MosaicSummary create_mosaic(const cv::Mat& source, const MosaicRequest& request,
                            const pool::TilePool& pool, core::EventEmitter& events,
                            const core::CancellationToken* cancel = nullptr);

} // namespace photomosaic::pipeline

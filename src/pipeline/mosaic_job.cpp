#include "photomosaic/pipeline/mosaic_job.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/io/image_io.hpp"
#include "photomosaic/pipeline/source_canvas.hpp"

#include <functional>
#include <iostream>

namespace photomosaic::pipeline {

namespace {

using core::json;

MosaicSummary execute(const MosaicRequest& request, const pool::TilePool& pool,
                      core::EventEmitter& events, const core::CancellationToken* cancel,
                      const std::function<cv::Mat()>& load_source) {
    const std::string& run_id = request.run_id;

    MosaicSummary summary;
    summary.run_id = run_id;
    summary.source_path = request.source_path;
    summary.output_path = request.output_path;

    events.run_start(run_id, {{"source", request.source_path.string()},
                              {"output", request.output_path.string()},
                              {"pool_size", pool.size()},
                              {"pool_groups", pool.group_count()},
                              {"variants_per_group", pool.variants_per_group()},
                              {"sample_length", pool.samples().cols()},
                              {"reuse", request.assignment.reuse},
                              {"rotate", pool.params().rotate()},
                              {"color_mode", color_mode_to_string(pool.params().color_mode())}});

    Phase current = Phase::SOURCE;
    try {
        // SOURCE
        events.phase_start(run_id, Phase::SOURCE);
        const SourceCanvas canvas = SourceCanvas::build(load_source(), pool.params());
        summary.x_tile_count = canvas.x_tile_count();
        summary.y_tile_count = canvas.y_tile_count();
        summary.cells_total = canvas.cell_count();
        events.phase_end(run_id, Phase::SOURCE, "ok",
                         {{"width", canvas.image().cols},
                          {"height", canvas.image().rows},
                          {"x_tile_count", canvas.x_tile_count()},
                          {"y_tile_count", canvas.y_tile_count()}});

        AssignmentEngine engine(pool, canvas, request.assignment);
        const ProgressFn progress = [&events, &run_id](Phase phase, int done, int total) {
            events.phase_progress(run_id, phase, done, total);
        };

        // RANKING
        current = Phase::RANKING;
        events.phase_start(run_id, Phase::RANKING, {{"cells", canvas.cell_count()}});
        const auto order = engine.traversal_order();
        const auto rankings = engine.rank_cells(order, cancel, progress);
        events.phase_end(run_id, Phase::RANKING,
                         rankings.size() == order.size() ? "ok" : "cancelled",
                         {{"ranked", rankings.size()}});

        // ASSIGNMENT
        current = Phase::ASSIGNMENT;
        events.phase_start(run_id, Phase::ASSIGNMENT);
        const AssignmentResult result = engine.assign(rankings, cancel, progress);
        summary.status = result.status;
        json assign_extra = {{"assigned", result.records.size()}};
        if (!request.assignment.reuse) {
            assign_extra["groups_remaining"] = engine.availability().remaining();
        }
        events.phase_end(run_id, Phase::ASSIGNMENT, assignment_status_to_string(result.status),
                         assign_extra);

        const int unassigned = summary.cells_total - static_cast<int>(result.records.size());
        if (result.status == AssignmentStatus::POOL_EXHAUSTED) {
            std::cerr << "[ASSIGN] tile pool exhausted after " << result.records.size()
                      << " cells, " << unassigned << " cells keep source pixels" << std::endl;
            events.warning(run_id, "tile pool exhausted",
                           {{"assigned", result.records.size()}, {"unassigned", unassigned}});
        } else if (result.status == AssignmentStatus::CANCELLED) {
            std::cerr << "[ASSIGN] stop requested after " << result.records.size()
                      << " cells, saving partial mosaic" << std::endl;
        }

        // COMPOSE
        current = Phase::COMPOSE;
        events.phase_start(run_id, Phase::COMPOSE);
        MosaicCanvas mosaic(canvas);
        BuildInstructions instructions;
        summary.skipped = compose_records(mosaic, instructions, result.records, pool, events, run_id);
        summary.filled = mosaic.tiles_placed();
        mosaic.save(request.output_path);
        events.phase_end(run_id, Phase::COMPOSE, "ok",
                         {{"filled", summary.filled},
                          {"skipped", summary.skipped},
                          {"output", request.output_path.string()}});

        // INSTRUCTIONS
        current = Phase::INSTRUCTIONS;
        events.phase_start(run_id, Phase::INSTRUCTIONS);
        if (request.instructions_path.empty() && request.instructions_json_path.empty()) {
            events.phase_end(run_id, Phase::INSTRUCTIONS, "skipped");
        } else {
            json extra = {{"entries", instructions.size()}};
            if (!request.instructions_path.empty()) {
                instructions.save_diagram(request.instructions_path, canvas.image().size(),
                                          request.label_font_scale);
                summary.instructions_path = request.instructions_path;
                extra["diagram"] = request.instructions_path.string();
            }
            if (!request.instructions_json_path.empty()) {
                instructions.save_json(request.instructions_json_path);
                summary.instructions_json_path = request.instructions_json_path;
                extra["json"] = request.instructions_json_path.string();
            }
            events.phase_end(run_id, Phase::INSTRUCTIONS, "ok", extra);
        }
    } catch (const std::exception& e) {
        events.phase_end(run_id, current, "error", {{"error", e.what()}});
        events.run_end(run_id, false, "error");
        throw;
    }

    events.run_end(run_id, true, assignment_status_to_string(summary.status),
                   {{"cells_total", summary.cells_total},
                    {"filled", summary.filled},
                    {"skipped", summary.skipped}});
    return summary;
}

} // namespace

int compose_records(MosaicCanvas& mosaic, BuildInstructions& instructions,
                    const std::vector<AssignmentRecord>& records,
                    const pool::TilePool& pool, core::EventEmitter& events,
                    const std::string& run_id) {
    int skipped = 0;
    for (const auto& rec : records) {
        try {
            mosaic.place_tile(pool.tile(rec.tile_index).image, rec.box);
        } catch (const SizeMismatchError& e) {
            ++skipped;
            std::cerr << "[COMPOSE] cell (" << rec.cell.x << "," << rec.cell.y
                      << ") skipped: " << e.what() << std::endl;
            events.warning(run_id, e.what(),
                           {{"cell", {rec.cell.x, rec.cell.y}},
                            {"tile_index", rec.tile_index}});
            continue;
        }
        instructions.add(rec.label, rec.box);
    }
    return skipped;
}

MosaicSummary create_mosaic(const MosaicRequest& request, const pool::TilePool& pool,
                            core::EventEmitter& events,
                            const core::CancellationToken* cancel) {
    return execute(request, pool, events, cancel,
                   [&request]() { return io::read_image(request.source_path); });
}

MosaicSummary create_mosaic(const cv::Mat& source, const MosaicRequest& request,
                            const pool::TilePool& pool, core::EventEmitter& events,
                            const core::CancellationToken* cancel) {
    return execute(request, pool, events, cancel, [&source]() { return source; });
}

} // namespace photomosaic::pipeline

#pragma once

#include "photomosaic/core/cancellation.hpp"
#include "photomosaic/core/types.hpp"
#include "photomosaic/pipeline/source_canvas.hpp"
#include "photomosaic/pool/tile_pool.hpp"

#include <functional>
#include <random>
#include <string>
#include <vector>

namespace photomosaic::pipeline {

struct AssignmentOptions {
    bool reuse = false;
    int shuffle_first = 0;
    unsigned int seed = 0; // 0 = nondeterministic
    int workers = 1;       // threads for the ranking phase
};

// Match ranking of one cell, kept in traversal order.
struct CellRanking {
    GridCoord cell;
    Box box;
    std::vector<int> ranking;
};

struct AssignmentRecord {
    int tile_index = 0;
    int group = 0;
    std::string label;
    GridCoord cell;
    Box box;
};

enum class AssignmentStatus {
    COMPLETED,
    POOL_EXHAUSTED,
    CANCELLED
};

std::string assignment_status_to_string(AssignmentStatus status);

struct AssignmentResult {
    std::vector<AssignmentRecord> records; // traversal order
    AssignmentStatus status = AssignmentStatus::COMPLETED;
    int cells_total = 0;
};

// (phase, current, total). rank_cells calls it from every worker thread, so
// it must be thread-safe when options.workers > 1.
using ProgressFn = std::function<void(Phase, int, int)>;

/**
 * Rotation groups not yet used in one assignment run. Consuming any tile
 * removes its whole group.
 */
class AvailabilitySet {
public:
    AvailabilitySet() = default;
    explicit AvailabilitySet(const pool::TilePool& pool);

    bool contains(int tile_index) const;
    void consume(int tile_index);

    bool empty() const { return remaining_ == 0; }
    int remaining() const { return remaining_; }

private:
    std::vector<int> group_of_;
    std::vector<char> group_available_;
    int remaining_ = 0;
};

/**
 * Assigns pool tiles to the cells of a source canvas.
 *
 * Phase 1 ranks every cell against the whole pool (parallel, read-only).
 * Phase 2 walks the rankings in traversal order: in reuse mode every cell
 * takes its top match; otherwise each cell takes the best tile whose rotation
 * group is still available, and assignment stops once no group is left.
 * A stop request is honoured between cells; records made so far are returned.
 *
 * The engine borrows pool and canvas; both must outlive it. The availability
 * set belongs to the engine, so concurrent engines may share one pool.
 */
class AssignmentEngine {
public:
    AssignmentEngine(const pool::TilePool& pool, const SourceCanvas& canvas,
                     AssignmentOptions options);

    std::vector<GridCoord> traversal_order();

    // On a stop request the result holds the rankings finished before it, as
    // a prefix of order.
    std::vector<CellRanking> rank_cells(const std::vector<GridCoord>& order,
                                        const core::CancellationToken* cancel = nullptr,
                                        const ProgressFn& progress = nullptr) const;

    AssignmentResult assign(const std::vector<CellRanking>& rankings,
                            const core::CancellationToken* cancel = nullptr,
                            const ProgressFn& progress = nullptr);

    // traversal_order + rank_cells + assign
    AssignmentResult run(const core::CancellationToken* cancel = nullptr,
                         const ProgressFn& progress = nullptr);

    const AvailabilitySet& availability() const { return availability_; }
    const AssignmentOptions& options() const { return options_; }

private:
    const pool::TilePool& pool_;
    const SourceCanvas& canvas_;
    AssignmentOptions options_;
    std::mt19937 rng_;
    AvailabilitySet availability_;
};

} // namespace photomosaic::pipeline

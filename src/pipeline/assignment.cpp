#include "photomosaic/pipeline/assignment.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/parallel.hpp"
#include "photomosaic/pipeline/traversal.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>
#include <stdexcept>

namespace photomosaic::pipeline {

namespace {

std::mt19937 make_rng(unsigned int seed) {
    if (seed != 0) return std::mt19937(seed);
    std::random_device rd;
    return std::mt19937(rd());
}

int progress_stride(std::size_t total) {
    return std::max(1, static_cast<int>(total / 100));
}

} // namespace

std::string assignment_status_to_string(AssignmentStatus status) {
    switch (status) {
        case AssignmentStatus::COMPLETED: return "completed";
        case AssignmentStatus::POOL_EXHAUSTED: return "pool_exhausted";
        case AssignmentStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

AvailabilitySet::AvailabilitySet(const pool::TilePool& pool)
    : group_available_(static_cast<std::size_t>(pool.group_count()), 1),
      remaining_(pool.group_count()) {
    group_of_.reserve(pool.size());
    for (const auto& t : pool.tiles()) {
        group_of_.push_back(t.group);
    }
}

bool AvailabilitySet::contains(int tile_index) const {
    if (tile_index < 0 || static_cast<std::size_t>(tile_index) >= group_of_.size()) {
        return false;
    }
    return group_available_[static_cast<std::size_t>(group_of_[static_cast<std::size_t>(tile_index)])] != 0;
}

void AvailabilitySet::consume(int tile_index) {
    if (!contains(tile_index)) {
        throw std::logic_error("tile " + std::to_string(tile_index) + " is not available");
    }
    group_available_[static_cast<std::size_t>(group_of_[static_cast<std::size_t>(tile_index)])] = 0;
    --remaining_;
}

AssignmentEngine::AssignmentEngine(const pool::TilePool& pool, const SourceCanvas& canvas,
                                   AssignmentOptions options)
    : pool_(pool),
      canvas_(canvas),
      options_(options),
      rng_(make_rng(options.seed)) {
    const MosaicParams& pp = pool_.params();
    const MosaicParams& cp = canvas_.params();
    if (pp.tile_size() != cp.tile_size() || pp.match_size() != cp.match_size() ||
        pp.color_mode() != cp.color_mode()) {
        std::ostringstream oss;
        oss << "pool tiles " << pp.tile_size().width << "x" << pp.tile_size().height << " "
            << color_mode_to_string(pp.color_mode()) << " do not fit canvas cells "
            << cp.tile_size().width << "x" << cp.tile_size().height << " "
            << color_mode_to_string(cp.color_mode());
        throw SizeMismatchError(oss.str());
    }
}

std::vector<GridCoord> AssignmentEngine::traversal_order() {
    return coords_from_middle(canvas_.x_tile_count(), canvas_.y_tile_count(),
                              canvas_.params().tile_ratio(), options_.shuffle_first, rng_);
}

std::vector<CellRanking> AssignmentEngine::rank_cells(const std::vector<GridCoord>& order,
                                                      const core::CancellationToken* cancel,
                                                      const ProgressFn& progress) const {
    std::vector<CellRanking> rankings(order.size());
    std::vector<char> done(order.size(), 0);
    std::atomic<int> completed{0};
    const int stride = progress_stride(order.size());
    const int total = static_cast<int>(order.size());

    core::parallel_for_index(order.size(), options_.workers, [&](std::size_t i) {
        if (core::stop_requested(cancel)) return;

        CellRanking& cr = rankings[i];
        cr.cell = order[i];
        cr.box = canvas_.cell_box(order[i]);
        cr.ranking = pool_.best_match_ranking(canvas_.block_sample(cr.box));
        done[i] = 1;

        int n = completed.fetch_add(1) + 1;
        if (progress && (n % stride == 0 || n == total)) {
            progress(Phase::RANKING, n, total);
        }
    });

    if (core::stop_requested(cancel)) {
        auto first_missing = std::find(done.begin(), done.end(), 0);
        rankings.resize(static_cast<std::size_t>(first_missing - done.begin()));
    }
    return rankings;
}

AssignmentResult AssignmentEngine::assign(const std::vector<CellRanking>& rankings,
                                          const core::CancellationToken* cancel,
                                          const ProgressFn& progress) {
    AssignmentResult result;
    result.cells_total = canvas_.cell_count();
    result.records.reserve(rankings.size());

    availability_ = AvailabilitySet(pool_);
    const int stride = progress_stride(rankings.size());
    const int total = static_cast<int>(rankings.size());

    for (std::size_t i = 0; i < rankings.size(); ++i) {
        if (core::stop_requested(cancel)) {
            result.status = AssignmentStatus::CANCELLED;
            break;
        }
        if (availability_.empty()) {
            result.status = AssignmentStatus::POOL_EXHAUSTED;
            break;
        }

        const CellRanking& cr = rankings[i];
        if (cr.ranking.empty()) {
            throw std::logic_error("cell ranking is empty");
        }

        int chosen = -1;
        if (options_.reuse) {
            chosen = cr.ranking.front();
        } else {
            for (int j : cr.ranking) {
                if (availability_.contains(j)) {
                    chosen = j;
                    break;
                }
            }
            if (chosen < 0) {
                throw std::logic_error("ranking does not cover the available tiles");
            }
            availability_.consume(chosen);
        }

        const pool::Tile& tile = pool_.tile(chosen);
        result.records.push_back(AssignmentRecord{chosen, tile.group, tile.display_label(),
                                                  cr.cell, cr.box});

        const int n = static_cast<int>(i) + 1;
        if (progress && (n % stride == 0 || n == total)) {
            progress(Phase::ASSIGNMENT, n, total);
        }
    }

    // Rankings cut short by a stop request during phase 1.
    if (result.status == AssignmentStatus::COMPLETED &&
        rankings.size() < static_cast<std::size_t>(result.cells_total) &&
        core::stop_requested(cancel)) {
        result.status = AssignmentStatus::CANCELLED;
    }
    return result;
}

AssignmentResult AssignmentEngine::run(const core::CancellationToken* cancel,
                                       const ProgressFn& progress) {
    const auto order = traversal_order();
    const auto rankings = rank_cells(order, cancel, progress);
    return assign(rankings, cancel, progress);
}

} // namespace photomosaic::pipeline

#pragma once

#include "photomosaic/core/params.hpp"
#include "photomosaic/core/types.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace photomosaic::pool {

// A decoded candidate image and its human-readable label.
struct TileSource {
    cv::Mat image;
    std::string label;
};

struct Tile {
    int index = 0;            // position in the pool, stable for a run
    int group = 0;            // rotation group: the TileSource it was made from
    int rotation_degrees = 0; // 0, 90, 180 or 270 (counter-clockwise)
    std::string label;
    cv::Mat image;            // tile_size, converted to the pool color mode

    std::string display_label() const;
};

/**
 * The fixed set of candidate tiles for one or more mosaics.
 *
 * Every tile keeps a full-resolution render copy and a row in samples(), its
 * match_size nearest-neighbour downsample. With rotation enabled every source
 * yields four consecutive tiles (0/90/180/270) that share one group id.
 *
 * Immutable after build; rankings never depend on which tiles a caller has
 * already consumed, so one pool may serve concurrent jobs.
 */
class TilePool {
public:
    // Throws PoolEmptyError for an empty source list and IOError for a source
    // without pixels.
    static TilePool build(const std::vector<TileSource>& sources,
                          const MosaicParams& params, int workers = 1);

    // Decodes the files (label = last four characters of the stem) and builds.
    static TilePool from_paths(const std::vector<fs::path>& paths,
                               const MosaicParams& params, int workers = 1);

    const MosaicParams& params() const { return params_; }
    std::size_t size() const { return tiles_.size(); }
    int group_count() const { return group_count_; }
    int variants_per_group() const { return params_.rotate() ? 4 : 1; }

    const Tile& tile(int index) const;
    const std::vector<Tile>& tiles() const { return tiles_; }
    const Matrix2Df& samples() const { return samples_; }

    // Mean squared difference between block and every tile sample.
    VectorXf distances(const RowVectorXf& block) const;

    // All tile indices ordered by ascending distance, ties by index.
    std::vector<int> best_match_ranking(const RowVectorXf& block) const;

private:
    TilePool(const MosaicParams& params, std::vector<Tile> tiles, Matrix2Df samples,
             int group_count);

    MosaicParams params_;
    std::vector<Tile> tiles_;
    Matrix2Df samples_;
    int group_count_ = 0;
};

} // namespace photomosaic::pool

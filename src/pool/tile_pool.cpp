#include "photomosaic/pool/tile_pool.hpp"
#include "photomosaic/core/errors.hpp"
#include "photomosaic/core/parallel.hpp"
#include "photomosaic/core/utils.hpp"
#include "photomosaic/image/processing.hpp"
#include "photomosaic/io/image_io.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iostream>
#include <numeric>
#include <utility>

namespace photomosaic::pool {

std::string Tile::display_label() const {
    if (rotation_degrees == 0) return label;
    return label + " r" + std::to_string(rotation_degrees);
}

TilePool::TilePool(const MosaicParams& params, std::vector<Tile> tiles,
                   Matrix2Df samples, int group_count)
    : params_(params),
      tiles_(std::move(tiles)),
      samples_(std::move(samples)),
      group_count_(group_count) {}

TilePool TilePool::build(const std::vector<TileSource>& sources,
                         const MosaicParams& params, int workers) {
    if (sources.empty()) {
        throw PoolEmptyError();
    }

    const int variants = params.rotate() ? 4 : 1;
    const std::size_t n_tiles = sources.size() * static_cast<std::size_t>(variants);

    std::vector<Tile> tiles(n_tiles);
    Matrix2Df samples(static_cast<Eigen::Index>(n_tiles), params.sample_length());

    core::parallel_for_index(sources.size(), workers, [&](std::size_t si) {
        const TileSource& src = sources[si];
        if (src.image.empty()) {
            throw IOError("tile '" + src.label + "' has no pixels");
        }

        for (int k = 0; k < variants; ++k) {
            // Rotating before the aspect crop keeps every variant at tile_size,
            // also for non-square tiles.
            cv::Mat rotated = image::rotate_quarter_turns(src.image, k);
            cv::Mat cropped = image::aspect_crop(rotated, params.tile_ratio());
            cv::Mat converted = image::convert_color_mode(cropped, params.color_mode());

            const std::size_t idx = si * static_cast<std::size_t>(variants) + static_cast<std::size_t>(k);
            Tile& t = tiles[idx];
            t.index = static_cast<int>(idx);
            t.group = static_cast<int>(si);
            t.rotation_degrees = 90 * k;
            t.label = src.label;
            t.image = image::resize_to(converted, params.tile_size());

            samples.row(static_cast<Eigen::Index>(idx)) =
                image::match_sample(t.image, params, cv::INTER_NEAREST);
        }
    });

    return TilePool(params, std::move(tiles), std::move(samples),
                    static_cast<int>(sources.size()));
}

TilePool TilePool::from_paths(const std::vector<fs::path>& paths,
                              const MosaicParams& params, int workers) {
    if (paths.empty()) {
        throw PoolEmptyError("no tile files found");
    }

    std::vector<TileSource> sources(paths.size());
    core::parallel_for_index(paths.size(), workers, [&](std::size_t i) {
        sources[i].image = io::read_image(paths[i]);
        sources[i].label = core::tile_label_from_path(paths[i]);
    });

    std::cerr << "[POOL] decoded " << sources.size() << " tile images" << std::endl;
    return build(sources, params, workers);
}

const Tile& TilePool::tile(int index) const {
    if (index < 0 || static_cast<std::size_t>(index) >= tiles_.size()) {
        throw std::out_of_range("tile index " + std::to_string(index) + " out of range");
    }
    return tiles_[static_cast<std::size_t>(index)];
}

VectorXf TilePool::distances(const RowVectorXf& block) const {
    if (block.size() != samples_.cols()) {
        throw SizeMismatchError("comparison block has " + std::to_string(block.size()) +
                                " values, pool samples have " +
                                std::to_string(samples_.cols()));
    }
    return (samples_.rowwise() - block).array().square().rowwise().mean().matrix();
}

std::vector<int> TilePool::best_match_ranking(const RowVectorXf& block) const {
    const VectorXf d = distances(block);

    std::vector<int> order(tiles_.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&d](int a, int b) { return d[a] < d[b]; });
    return order;
}

} // namespace photomosaic::pool

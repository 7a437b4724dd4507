/*
 * beam_weights.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_STATISTICS_BEAM_WEIGHTS_H
#define CREDO_ALGORITHMS_STATISTICS_BEAM_WEIGHTS_H

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>
#include <credo/array_family/image_types.h>
#include <credo/error.h>
#include <credo/logging.h>
#include <credo/util/row_blocks.h>

namespace credo { namespace algorithms {

  /** A half open [begin, end) range of pixel indices */
  typedef std::array<std::size_t, 2> index_range;

  /**
   * Intensity weighted statistics of the beam spot
   */
  struct BeamWeights {
    double sum;
    double max;
    double mean_row;
    double mean_col;
    double std_row;
    double std_col;
    std::size_t count;
  };

  namespace detail {

    /**
     * Partial sums of a block of rows
     */
    struct BeamWeightSums {
      double sum;
      double max;
      double row;
      double col;
      double row2;
      double col2;
      std::size_t count;

      BeamWeightSums()
          : sum(0), max(0), row(0), col(0), row2(0), col2(0), count(0) {}

      void merge(const BeamWeightSums &other) {
        if (other.count > 0) {
          max = count > 0 ? std::max(max, other.max) : other.max;
        }
        sum += other.sum;
        row += other.row;
        col += other.col;
        row2 += other.row2;
        col2 += other.col2;
        count += other.count;
      }
    };

    inline void clip_index_range(const std::optional<index_range> &range,
                                 std::size_t size,
                                 std::size_t &begin,
                                 std::size_t &end) {
      begin = 0;
      end = size;
      if (range) {
        begin = std::min((*range)[0], size);
        end = std::min((*range)[1], size);
        if (end < begin) {
          end = begin;
        }
      }
    }

  }  // namespace detail

  /**
   * Calculate the sum, maximum, centroid and spread of the intensity in a
   * region of the image. Only unmasked pixels with finite, positive
   * intensity contribute. If none do, count is zero and the centroid and
   * spread are NaN.
   * @param image The image
   * @param mask The mask
   * @param row_range Optional [begin, end) row range
   * @param col_range Optional [begin, end) column range
   * @param nthreads The number of threads
   * @returns The beam statistics
   */
  inline BeamWeights beam_weights(const image_type &image,
                                  const mask_type &mask,
                                  std::optional<index_range> row_range = std::nullopt,
                                  std::optional<index_range> col_range = std::nullopt,
                                  std::size_t nthreads = 1) {
    CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");

    std::size_t row_begin, row_end, col_begin, col_end;
    detail::clip_index_range(row_range, image.rows(), row_begin, row_end);
    detail::clip_index_range(col_range, image.cols(), col_begin, col_end);

    std::vector<util::RowBlock> blocks = util::make_row_blocks(row_begin, row_end);
    std::vector<detail::BeamWeightSums> partial(blocks.size());
    util::for_each_row_block(
      blocks, nthreads, [&](std::size_t index, const util::RowBlock &block) {
        detail::BeamWeightSums &s = partial[index];
        for (std::size_t j = block.begin; j < block.end; ++j) {
          for (std::size_t i = col_begin; i < col_end; ++i) {
            double value = image(j, i);
            if (!mask(j, i) || !std::isfinite(value) || !(value > 0)) {
              continue;
            }
            s.max = s.count > 0 ? std::max(s.max, value) : value;
            s.sum += value;
            s.row += value * j;
            s.col += value * i;
            s.row2 += value * j * j;
            s.col2 += value * i * i;
            s.count++;
          }
        }
      });

    detail::BeamWeightSums total;
    for (std::size_t k = 0; k < partial.size(); ++k) {
      total.merge(partial[k]);
    }

    BeamWeights result;
    result.sum = total.sum;
    result.max = total.max;
    result.count = total.count;
    if (total.count == 0) {
      double nan = std::numeric_limits<double>::quiet_NaN();
      result.mean_row = result.mean_col = nan;
      result.std_row = result.std_col = nan;
    } else {
      result.mean_row = total.row / total.sum;
      result.mean_col = total.col / total.sum;
      result.std_row =
        std::sqrt(std::max(0.0, total.row2 / total.sum - result.mean_row * result.mean_row));
      result.std_col =
        std::sqrt(std::max(0.0, total.col2 / total.sum - result.mean_col * result.mean_col));
    }
    credo_log::debug("beam weights: sum={}, max={}, row={}, col={}, count={}",
                     result.sum,
                     result.max,
                     result.mean_row,
                     result.mean_col,
                     result.count);
    return result;
  }

  /**
   * Calculate the moment of inertia of the intensity in an annulus around a
   * center: the sum of r^2 * I over the valid pixels with r_min <= r <= r_max.
   * The intensity is expected to concentrate around the true beam center.
   * @param image The image
   * @param mask The mask
   * @param beam_row The row coordinate of the center
   * @param beam_col The column coordinate of the center
   * @param r_min The inner radius (pixels)
   * @param r_max The outer radius (pixels)
   * @param nthreads The number of threads
   * @returns The moment of inertia
   */
  inline double moment_of_inertia(const image_type &image,
                                  const mask_type &mask,
                                  double beam_row,
                                  double beam_col,
                                  double r_min,
                                  double r_max,
                                  std::size_t nthreads = 1) {
    CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
    double r2min = r_min * r_min;
    double r2max = r_max * r_max;
    std::vector<util::RowBlock> blocks = util::make_row_blocks(0, image.rows());
    std::vector<double> partial(blocks.size(), 0.0);
    util::for_each_row_block(
      blocks, nthreads, [&](std::size_t index, const util::RowBlock &block) {
        double sum = 0;
        for (std::size_t j = block.begin; j < block.end; ++j) {
          for (Eigen::Index i = 0; i < image.cols(); ++i) {
            double value = image(j, i);
            if (!mask(j, i) || !std::isfinite(value)) {
              continue;
            }
            double dr = j - beam_row;
            double dc = i - beam_col;
            double r2 = dr * dr + dc * dc;
            if (r2 >= r2min && r2 <= r2max) {
              sum += r2 * value;
            }
          }
        }
        partial[index] = sum;
      });
    double result = 0;
    for (std::size_t k = 0; k < partial.size(); ++k) {
      result += partial[k];
    }
    return result;
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_STATISTICS_BEAM_WEIGHTS_H

/*
 * fast_average.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_FAST_AVERAGE_H
#define CREDO_ALGORITHMS_INTEGRATION_FAST_AVERAGE_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <credo/algorithms/masking/mask_shapes.h>
#include <credo/array_family/image_types.h>
#include <credo/error.h>

namespace credo { namespace algorithms {

  /**
   * The result of an unweighted average: the mean abscissa, the mean
   * intensity and the number of pixels in each bin. Empty bins are NaN.
   */
  struct FastAverage {
    vector_type abscissa;
    vector_type intensity;
    count_vector_type area;
  };

  namespace detail {

    inline FastAverage make_fast_average(std::size_t count) {
      FastAverage result;
      result.abscissa = vector_type::Zero(count);
      result.intensity = vector_type::Zero(count);
      result.area = count_vector_type::Zero(count);
      return result;
    }

    inline void finish_fast_average(FastAverage &result) {
      double nan = std::numeric_limits<double>::quiet_NaN();
      for (Eigen::Index l = 0; l < result.area.size(); ++l) {
        if (result.area[l] == 0) {
          result.abscissa[l] = nan;
          result.intensity[l] = nan;
        } else {
          result.abscissa[l] /= result.area[l];
          result.intensity[l] /= result.area[l];
        }
      }
    }

  }  // namespace detail

  /**
   * Radial average in pixel units without error propagation, for quick
   * evaluation during the beam center search. count equal bins span
   * [r_min, r_max].
   * @param image The image
   * @param mask The mask
   * @param beam_row The row coordinate of the center
   * @param beam_col The column coordinate of the center
   * @param r_min The smallest radius
   * @param r_max The largest radius
   * @param count The number of bins
   * @returns The average
   */
  inline FastAverage fast_radial_average(const image_type &image,
                                         const mask_type &mask,
                                         double beam_row,
                                         double beam_col,
                                         double r_min,
                                         double r_max,
                                         std::size_t count) {
    CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
    CREDO_INPUT_ASSERT(count > 0, "the number of bins must be positive");
    CREDO_INPUT_ASSERT(r_max > r_min, "the radius range is empty");
    FastAverage result = detail::make_fast_average(count);
    double width = (r_max - r_min) / count;
    for (Eigen::Index j = 0; j < image.rows(); ++j) {
      for (Eigen::Index i = 0; i < image.cols(); ++i) {
        double value = image(j, i);
        if (!mask(j, i) || !std::isfinite(value)) {
          continue;
        }
        double dr = j - beam_row;
        double dc = i - beam_col;
        double r = std::sqrt(dr * dr + dc * dc);
        if (r < r_min || r > r_max) {
          continue;
        }
        std::size_t l = std::min(static_cast<std::size_t>((r - r_min) / width), count - 1);
        result.abscissa[l] += r;
        result.intensity[l] += value;
        result.area[l]++;
      }
    }
    detail::finish_fast_average(result);
    return result;
  }

  /**
   * Azimuthal average without error propagation: count equal sectors span
   * [0, 2pi).
   * @param image The image
   * @param mask The mask
   * @param beam_row The row coordinate of the center
   * @param beam_col The column coordinate of the center
   * @param count The number of sectors
   * @returns The average
   */
  inline FastAverage fast_azimuthal_average(const image_type &image,
                                            const mask_type &mask,
                                            double beam_row,
                                            double beam_col,
                                            std::size_t count) {
    CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
    CREDO_INPUT_ASSERT(count > 0, "the number of sectors must be positive");
    FastAverage result = detail::make_fast_average(count);
    double width = 2 * M_PI / count;
    for (Eigen::Index j = 0; j < image.rows(); ++j) {
      for (Eigen::Index i = 0; i < image.cols(); ++i) {
        double value = image(j, i);
        if (!mask(j, i) || !std::isfinite(value)) {
          continue;
        }
        if (j == beam_row && i == beam_col) {
          continue;
        }
        double phi = pixel_azimuth(j, i, beam_row, beam_col);
        std::size_t l = std::min(static_cast<std::size_t>(phi / width), count - 1);
        result.abscissa[l] += phi;
        result.intensity[l] += value;
        result.area[l]++;
      }
    }
    detail::finish_fast_average(result);
    return result;
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_FAST_AVERAGE_H

/*
 * target_functions.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_CENTERING_TARGET_FUNCTIONS_H
#define CREDO_ALGORITHMS_CENTERING_TARGET_FUNCTIONS_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <credo/algorithms/integration/fast_average.h>
#include <credo/algorithms/masking/mask_shapes.h>
#include <credo/algorithms/statistics/beam_weights.h>
#include <credo/array_family/image_types.h>

namespace credo { namespace algorithms {

  /*
   * Figures of merit for a trial beam center, smaller is better. They all
   * look at the scattering in the annulus r_min <= r <= r_max (pixels)
   * around the trial center, which should be rotationally symmetric when
   * the center is right.
   */

  /**
   * The negative moment of inertia of the annulus
   */
  inline double moment_of_inertia_target(const image_type &image,
                                         const mask_type &mask,
                                         double beam_row,
                                         double beam_col,
                                         double r_min,
                                         double r_max) {
    return -moment_of_inertia(image, mask, beam_row, beam_col, r_min, r_max);
  }

  /**
   * The standard deviation of the azimuthal average in the annulus
   */
  inline double azimuthal_target(const image_type &image,
                                 const mask_type &mask,
                                 double beam_row,
                                 double beam_col,
                                 double r_min,
                                 double r_max) {
    // One sector per pixel of the mean circumference
    double sectors = (r_min + r_max) * M_PI / 2;
    if (!(r_max > r_min) || !(sectors >= 1)) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    std::size_t count = static_cast<std::size_t>(sectors);
    mask_type annulus = mask_for_annulus(mask, beam_row, beam_col, r_min, r_max);
    FastAverage avg = fast_azimuthal_average(image, annulus, beam_row, beam_col, count);
    double sum = 0, sum2 = 0;
    std::size_t n = 0;
    for (Eigen::Index l = 0; l < avg.area.size(); ++l) {
      if (avg.area[l] > 0) {
        sum += avg.intensity[l];
        sum2 += avg.intensity[l] * avg.intensity[l];
        n++;
      }
    }
    if (n == 0) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    double mean = sum / n;
    return std::sqrt(std::max(0.0, sum2 / n - mean * mean));
  }

  /**
   * The mean absolute difference between the azimuthal average and the
   * same average rotated by 180 degrees
   */
  inline double azimuthal_fold_target(const image_type &image,
                                      const mask_type &mask,
                                      double beam_row,
                                      double beam_col,
                                      double r_min,
                                      double r_max) {
    double sectors = (r_min + r_max) * M_PI / 4;
    if (!(r_max > r_min) || !(sectors >= 1)) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    std::size_t half = static_cast<std::size_t>(sectors);
    mask_type annulus = mask_for_annulus(mask, beam_row, beam_col, r_min, r_max);
    FastAverage avg = fast_azimuthal_average(image, annulus, beam_row, beam_col, 2 * half);
    double sum = 0;
    std::size_t n = 0;
    for (std::size_t l = 0; l < half; ++l) {
      double diff = avg.intensity[l] - avg.intensity[l + half];
      if (std::isfinite(diff)) {
        sum += std::fabs(diff);
        n++;
      }
    }
    return n > 0 ? sum / n : std::numeric_limits<double>::quiet_NaN();
  }

  /**
   * Compare the radial averages in four quadrant sectors: the mean squared
   * difference of opposite sectors, over the radii where all four sectors
   * have pixels
   */
  inline double slices_target(const image_type &image,
                              const mask_type &mask,
                              double beam_row,
                              double beam_col,
                              double r_min,
                              double r_max) {
    // Bins one pixel wide
    if (!(r_max - r_min >= 1)) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    std::size_t count = static_cast<std::size_t>(r_max - r_min);
    FastAverage sector[4];
    for (std::size_t k = 0; k < 4; ++k) {
      mask_type m = mask_for_sectors(
        mask, beam_row, beam_col, M_PI * 0.25 + k * M_PI * 0.5, M_PI * 0.25, false);
      sector[k] = fast_radial_average(image, m, beam_row, beam_col, r_min, r_max, count);
    }
    double sum = 0;
    std::size_t n = 0;
    for (std::size_t l = 0; l < count; ++l) {
      if (sector[0].area[l] == 0 || sector[1].area[l] == 0 || sector[2].area[l] == 0
          || sector[3].area[l] == 0) {
        continue;
      }
      double d02 = sector[0].intensity[l] - sector[2].intensity[l];
      double d13 = sector[1].intensity[l] - sector[3].intensity[l];
      sum += d02 * d02 + d13 * d13;
      n++;
    }
    return n > 0 ? sum / n : std::numeric_limits<double>::quiet_NaN();
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_CENTERING_TARGET_FUNCTIONS_H

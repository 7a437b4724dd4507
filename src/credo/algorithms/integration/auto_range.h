/*
 * auto_range.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_AUTO_RANGE_H
#define CREDO_ALGORITHMS_INTEGRATION_AUTO_RANGE_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <credo/algorithms/integration/abscissa_transform.h>
#include <credo/array_family/image_types.h>
#include <credo/logging.h>
#include <credo/model/modes.h>

namespace credo { namespace algorithms {

  using model::RangeSpacing;

  /**
   * Automatically determined bin edges
   */
  struct AutoRange {
    vector_type edges;
    RangeSpacing spacing_used;
    double min;
    double max;
    // True if there were no valid pixels, or logarithmic spacing was
    // requested with a non-positive minimum and linear spacing was used.
    bool degenerate;
  };

  /**
   * The default number of bins for an image: half the diagonal.
   */
  inline std::size_t default_bin_count(std::size_t rows, std::size_t cols) {
    return static_cast<std::size_t>(
      std::ceil(std::sqrt(static_cast<double>(rows * rows + cols * cols)) / 2));
  }

  /**
   * Determine the bin edges spanning the abscissa range of the unmasked
   * pixels.
   * @param geometry The experimental geometry
   * @param mask The mask
   * @param kind The abscissa kind
   * @param spacing Linear or logarithmic spacing
   * @param count The number of edges (0 for the default)
   * @returns The bin edges
   */
  inline AutoRange auto_range(const Geometry &geometry,
                              const mask_type &mask,
                              AbscissaKind kind,
                              RangeSpacing spacing,
                              std::size_t count = 0) {
    AbscissaTransform transform(geometry, kind);
    switch (spacing) {
    case RangeSpacing::Linear:
    case RangeSpacing::Logarithmic:
      break;
    default:
      CREDO_CONFIGURATION_ERROR("unknown range spacing");
    }
    if (count == 0) {
      count = default_bin_count(mask.rows(), mask.cols());
    }

    double vmin = std::numeric_limits<double>::infinity();
    double vmax = -std::numeric_limits<double>::infinity();
    for (Eigen::Index j = 0; j < mask.rows(); ++j) {
      for (Eigen::Index i = 0; i < mask.cols(); ++i) {
        if (!mask(j, i)) {
          continue;
        }
        double x = transform.value(transform.pixel_radius_value(j, i));
        if (!std::isfinite(x)) {
          continue;
        }
        vmin = std::min(vmin, x);
        vmax = std::max(vmax, x);
      }
    }

    AutoRange result;
    result.spacing_used = spacing;
    result.min = vmin;
    result.max = vmax;
    result.degenerate = false;
    if (vmin > vmax) {
      credo_log::warning("no valid pixels, the automatic range is empty");
      result.edges = vector_type();
      result.min = result.max = std::numeric_limits<double>::quiet_NaN();
      result.degenerate = true;
      return result;
    }
    if (spacing == RangeSpacing::Logarithmic && !(vmin > 0)) {
      credo_log::warning(
        "the smallest abscissa is {}, falling back to linear spacing", vmin);
      result.spacing_used = RangeSpacing::Linear;
      result.degenerate = true;
    }
    if (result.spacing_used == RangeSpacing::Logarithmic) {
      result.edges = logspace(vmin, vmax, count);
    } else {
      result.edges = linspace(vmin, vmax, count);
    }
    return result;
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_AUTO_RANGE_H

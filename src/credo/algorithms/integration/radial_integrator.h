/*
 * radial_integrator.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_RADIAL_INTEGRATOR_H
#define CREDO_ALGORITHMS_INTEGRATION_RADIAL_INTEGRATOR_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>
#include <credo/algorithms/integration/abscissa_transform.h>
#include <credo/algorithms/integration/auto_range.h>
#include <credo/algorithms/integration/error_propagation.h>
#include <credo/array_family/image_types.h>
#include <credo/error.h>
#include <credo/logging.h>
#include <credo/model/curve.h>
#include <credo/model/settings.h>
#include <credo/util/row_blocks.h>

namespace credo { namespace algorithms {

  using model::Curve;
  using model::IntegrationSettings;
  using model::PixelTally;

  /**
   * Check that bin edges are usable: at least one, all finite and in non
   * decreasing order.
   */
  inline void check_bin_edges(const vector_type &edges) {
    CREDO_INPUT_ASSERT(edges.size() > 0, "no bin edges given");
    for (Eigen::Index k = 0; k < edges.size(); ++k) {
      CREDO_INPUT_ASSERT(std::isfinite(edges[k]), "bin edges must be finite");
      if (k > 0) {
        CREDO_INPUT_ASSERT(edges[k] >= edges[k - 1], "bin edges must be ascending");
      }
    }
  }

  /**
   * The upper limit of each bin: the midpoint to the next edge, and the last
   * edge itself for the last bin.
   */
  inline std::vector<double> bin_upper_limits(const vector_type &edges) {
    std::size_t n = edges.size();
    std::vector<double> upper(n);
    for (std::size_t l = 0; l + 1 < n; ++l) {
      upper[l] = 0.5 * (edges[l] + edges[l + 1]);
    }
    if (n > 0) {
      upper[n - 1] = edges[n - 1];
    }
    return upper;
  }

  /**
   * Reduce a 2D scattering pattern to a 1D curve by averaging the pixels in
   * bins of the abscissa (pixel radius, detector radius, scattering angle or
   * momentum transfer).
   *
   * Each pixel is checked in turn for being masked, for a non-finite
   * intensity or uncertainty, for a non-finite abscissa and for falling
   * below the first or above the last bin edge. The first failing check is
   * counted in the tally of the curve. Remaining pixels go into the first
   * bin whose upper limit is not smaller than the abscissa of the pixel.
   *
   * Intensities and abscissae are averaged with independently selected
   * error propagation methods. Bins without pixels have zero area and NaN
   * values.
   *
   * The image is processed in blocks of rows whose partial sums are merged
   * in a fixed order, so the result does not depend on the number of
   * threads.
   */
  class RadialIntegrator {
  public:
    /**
     * @param geometry The experimental geometry
     * @param settings The integration settings
     */
    RadialIntegrator(const Geometry &geometry, const IntegrationSettings &settings)
        : transform_(geometry, settings.abscissa), settings_(settings) {
      check_error_propagation(settings.intensity_error_propagation);
      check_error_propagation(settings.abscissa_error_propagation);
    }

    const IntegrationSettings &settings() const {
      return settings_;
    }

    const AbscissaTransform &transform() const {
      return transform_;
    }

    /**
     * Integrate an image with unit uncertainties
     * @param image The image
     * @param mask The mask
     * @param edges The bin edges
     * @returns The curve
     */
    Curve operator()(const image_type &image,
                     const mask_type &mask,
                     const vector_type &edges) const {
      return integrate(image, nullptr, mask, edges);
    }

    /**
     * Integrate an image with per-pixel uncertainties
     * @param image The image
     * @param error The absolute uncertainty of each pixel
     * @param mask The mask
     * @param edges The bin edges
     * @returns The curve
     */
    Curve operator()(const image_type &image,
                     const image_type &error,
                     const mask_type &mask,
                     const vector_type &edges) const {
      return integrate(image, &error, mask, edges);
    }

    /**
     * Integrate an image with unit uncertainties, with automatic bin edges
     */
    Curve operator()(const image_type &image, const mask_type &mask) const {
      CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
      return integrate_auto(image, nullptr, mask);
    }

    /**
     * Integrate an image with per-pixel uncertainties, with automatic bin
     * edges
     */
    Curve operator()(const image_type &image,
                     const image_type &error,
                     const mask_type &mask) const {
      CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
      CREDO_INPUT_ASSERT(all_eq(image, error), "image and error shapes differ");
      return integrate_auto(image, &error, mask);
    }

    /**
     * Determine the automatic bin edges for a mask with these settings
     */
    AutoRange range(const mask_type &mask) const {
      return auto_range(transform_.geometry(),
                        mask,
                        settings_.abscissa,
                        settings_.range_spacing,
                        settings_.range_count);
    }

  private:
    /**
     * Partial sums of a block of rows
     */
    struct BlockSums {
      std::vector<ErrorPropagationAccumulator> intensity;
      std::vector<ErrorPropagationAccumulator> abscissa;
      PixelTally tally;
    };

    Curve integrate_auto(const image_type &image,
                         const image_type *error,
                         const mask_type &mask) const {
      AutoRange r = range(mask);
      if (r.edges.size() == 0) {
        // Nothing to integrate: every pixel is masked
        Curve curve(0);
        PixelTally tally;
        tally.masked = image.size();
        curve.set_tally(tally);
        return curve;
      }
      return integrate(image, error, mask, r.edges);
    }

    Curve integrate(const image_type &image,
                    const image_type *error,
                    const mask_type &mask,
                    const vector_type &edges) const {
      // Check everything before accumulating anything
      CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
      if (error != nullptr) {
        CREDO_INPUT_ASSERT(all_eq(image, *error), "image and error shapes differ");
      }
      check_bin_edges(edges);

      const std::size_t nbins = edges.size();
      const std::vector<double> upper = bin_upper_limits(edges);
      const double first = edges[0];
      const double last = edges[nbins - 1];
      const ErrorPropagation iprop = settings_.intensity_error_propagation;
      const ErrorPropagation aprop = settings_.abscissa_error_propagation;

      std::vector<util::RowBlock> blocks = util::make_row_blocks(0, image.rows());
      std::vector<BlockSums> partial(blocks.size());
      util::for_each_row_block(
        blocks, settings_.nthreads, [&](std::size_t index, const util::RowBlock &block) {
          BlockSums &sums = partial[index];
          sums.intensity.resize(nbins);
          sums.abscissa.resize(nbins);
          for (std::size_t j = block.begin; j < block.end; ++j) {
            for (Eigen::Index i = 0; i < image.cols(); ++i) {
              if (!mask(j, i)) {
                sums.tally.masked++;
                continue;
              }
              double value = image(j, i);
              if (!std::isfinite(value)) {
                sums.tally.invalid_intensity++;
                continue;
              }
              double sigma = 1.0;
              if (error != nullptr) {
                sigma = (*error)(j, i);
                if (!std::isfinite(sigma)) {
                  sums.tally.invalid_error++;
                  continue;
                }
              }
              ValueWithError x = transform_.at_pixel(j, i);
              if (!std::isfinite(x.value) || !std::isfinite(x.error)) {
                sums.tally.invalid_abscissa++;
                continue;
              }
              if (x.value < first) {
                sums.tally.underflow++;
                continue;
              }
              if (x.value > last) {
                sums.tally.overflow++;
                continue;
              }
              std::size_t l =
                std::lower_bound(upper.begin(), upper.end(), x.value) - upper.begin();
              CREDO_ASSERT(l < nbins);
              sums.intensity[l].add(iprop, value, sigma);
              sums.abscissa[l].add(aprop, x.value, x.error);
            }
          }
        });

      // Merge the blocks in order
      std::vector<ErrorPropagationAccumulator> intensity(nbins);
      std::vector<ErrorPropagationAccumulator> abscissa(nbins);
      PixelTally tally;
      for (std::size_t k = 0; k < partial.size(); ++k) {
        for (std::size_t l = 0; l < nbins; ++l) {
          intensity[l].merge(partial[k].intensity[l]);
          abscissa[l].merge(partial[k].abscissa[l]);
        }
        tally += partial[k].tally;
      }

      Curve curve(nbins);
      for (std::size_t l = 0; l < nbins; ++l) {
        if (intensity[l].count() == 0) {
          continue;
        }
        double x, dx, y, dy;
        abscissa[l].result(aprop, x, dx);
        intensity[l].result(iprop, y, dy);
        curve.set_bin(l, x, dx, y, dy, intensity[l].count());
      }
      curve.set_tally(tally);

      credo_log::debug(
        "radial integration: {} bins, {} pixels binned, {} masked, {} invalid, "
        "{} underflow, {} overflow",
        nbins,
        curve.total_area(),
        tally.masked,
        tally.invalid_intensity + tally.invalid_error + tally.invalid_abscissa,
        tally.underflow,
        tally.overflow);
      return curve;
    }

    AbscissaTransform transform_;
    IntegrationSettings settings_;
  };

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_RADIAL_INTEGRATOR_H

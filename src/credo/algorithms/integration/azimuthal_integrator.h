/*
 * azimuthal_integrator.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_AZIMUTHAL_INTEGRATOR_H
#define CREDO_ALGORITHMS_INTEGRATION_AZIMUTHAL_INTEGRATOR_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>
#include <credo/algorithms/integration/abscissa_transform.h>
#include <credo/algorithms/integration/error_propagation.h>
#include <credo/algorithms/masking/mask_shapes.h>
#include <credo/array_family/image_types.h>
#include <credo/error.h>
#include <credo/logging.h>
#include <credo/model/curve.h>
#include <credo/model/settings.h>
#include <credo/util/row_blocks.h>

namespace credo { namespace algorithms {

  using model::AzimuthalCurve;
  using model::IntegrationSettings;
  using model::PixelTally;

  /**
   * Average the pixels of an image in equal sectors of the azimuth angle.
   * Use a mask (e.g. from mask_for_annulus) to restrict the radial range.
   *
   * Pixels are validated as in the radial integrator; the pixel at the beam
   * center has no azimuth and is counted as an invalid abscissa. The azimuth
   * uncertainty comes from the beam center uncertainty. The intensity
   * follows the intensity error propagation method of the settings and the
   * azimuth the abscissa one. The mean and the standard deviation of q are
   * reported for each sector.
   */
  class AzimuthalIntegrator {
  public:
    /**
     * @param geometry The experimental geometry
     * @param settings The integration settings (the abscissa kind is unused)
     */
    AzimuthalIntegrator(const Geometry &geometry, const IntegrationSettings &settings)
        : q_(geometry, AbscissaKind::Q), settings_(settings) {
      check_error_propagation(settings.intensity_error_propagation);
      check_error_propagation(settings.abscissa_error_propagation);
    }

    /**
     * Integrate with unit uncertainties
     * @param image The image
     * @param mask The mask
     * @param count The number of sectors
     */
    AzimuthalCurve operator()(const image_type &image,
                              const mask_type &mask,
                              std::size_t count) const {
      return integrate(image, nullptr, mask, count);
    }

    /**
     * Integrate with per-pixel uncertainties
     * @param image The image
     * @param error The absolute uncertainty of each pixel
     * @param mask The mask
     * @param count The number of sectors
     */
    AzimuthalCurve operator()(const image_type &image,
                              const image_type &error,
                              const mask_type &mask,
                              std::size_t count) const {
      return integrate(image, &error, mask, count);
    }

  private:
    struct BlockSums {
      std::vector<ErrorPropagationAccumulator> intensity;
      std::vector<ErrorPropagationAccumulator> phi;
      std::vector<double> q;
      std::vector<double> q2;
      PixelTally tally;
    };

    AzimuthalCurve integrate(const image_type &image,
                             const image_type *error,
                             const mask_type &mask,
                             std::size_t count) const {
      CREDO_INPUT_ASSERT(all_eq(image, mask), "image and mask shapes differ");
      if (error != nullptr) {
        CREDO_INPUT_ASSERT(all_eq(image, *error), "image and error shapes differ");
      }
      CREDO_INPUT_ASSERT(count > 0, "the number of sectors must be positive");

      const Geometry &g = q_.geometry();
      const double srow = g.beam_row_error();
      const double scol = g.beam_col_error();
      const double width = 2 * M_PI / count;
      const ErrorPropagation iprop = settings_.intensity_error_propagation;
      const ErrorPropagation aprop = settings_.abscissa_error_propagation;

      std::vector<util::RowBlock> blocks = util::make_row_blocks(0, image.rows());
      std::vector<BlockSums> partial(blocks.size());
      util::for_each_row_block(
        blocks, settings_.nthreads, [&](std::size_t index, const util::RowBlock &block) {
          BlockSums &sums = partial[index];
          sums.intensity.resize(count);
          sums.phi.resize(count);
          sums.q.assign(count, 0.0);
          sums.q2.assign(count, 0.0);
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
              double dr = j - g.beam_row();
              double dc = i - g.beam_col();
              double rho2 = dr * dr + dc * dc;
              if (!(rho2 > 0)) {
                sums.tally.invalid_abscissa++;
                continue;
              }
              double phi = pixel_azimuth(j, i, g.beam_row(), g.beam_col());
              double dphi = std::sqrt(dc * dc * srow * srow + dr * dr * scol * scol) / rho2;
              std::size_t l = std::min(static_cast<std::size_t>(phi / width), count - 1);
              double q = q_.value(std::sqrt(rho2));
              sums.intensity[l].add(iprop, value, sigma);
              sums.phi[l].add(aprop, phi, dphi);
              sums.q[l] += q;
              sums.q2[l] += q * q;
            }
          }
        });

      std::vector<ErrorPropagationAccumulator> intensity(count);
      std::vector<ErrorPropagationAccumulator> phi(count);
      std::vector<double> q(count, 0.0), q2(count, 0.0);
      PixelTally tally;
      for (std::size_t k = 0; k < partial.size(); ++k) {
        for (std::size_t l = 0; l < count; ++l) {
          intensity[l].merge(partial[k].intensity[l]);
          phi[l].merge(partial[k].phi[l]);
          q[l] += partial[k].q[l];
          q2[l] += partial[k].q2[l];
        }
        tally += partial[k].tally;
      }

      AzimuthalCurve curve(count);
      for (std::size_t l = 0; l < count; ++l) {
        std::size_t n = intensity[l].count();
        if (n == 0) {
          continue;
        }
        double x, dx, y, dy;
        phi[l].result(aprop, x, dx);
        intensity[l].result(iprop, y, dy);
        curve.set_bin(l, x, dx, y, dy, n);
        double qmean = q[l] / n;
        curve.set_q(l, qmean, std::sqrt(std::max(0.0, q2[l] / n - qmean * qmean)));
      }
      curve.set_tally(tally);
      credo_log::debug("azimuthal integration: {} sectors, {} pixels binned",
                       count,
                       curve.total_area());
      return curve;
    }

    AbscissaTransform q_;
    IntegrationSettings settings_;
  };

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_AZIMUTHAL_INTEGRATOR_H

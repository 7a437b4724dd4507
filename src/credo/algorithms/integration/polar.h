/*
 * polar.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_POLAR_H
#define CREDO_ALGORITHMS_INTEGRATION_POLAR_H

#include <algorithm>
#include <cmath>
#include <limits>
#include <credo/algorithms/integration/abscissa_transform.h>
#include <credo/array_family/image_types.h>
#include <credo/error.h>

namespace credo { namespace algorithms {

  /**
   * Bilinear interpolation of the image at a fractional pixel position.
   * Positions outside the pixel centers of the image give NaN.
   */
  inline double interpolate(const image_type &image, double row, double col) {
    if (!(row >= 0 && col >= 0 && row <= image.rows() - 1 && col <= image.cols() - 1)) {
      return std::numeric_limits<double>::quiet_NaN();
    }
    Eigen::Index j0 = static_cast<Eigen::Index>(std::floor(row));
    Eigen::Index i0 = static_cast<Eigen::Index>(std::floor(col));
    Eigen::Index j1 = std::min<Eigen::Index>(j0 + 1, image.rows() - 1);
    Eigen::Index i1 = std::min<Eigen::Index>(i0 + 1, image.cols() - 1);
    double fy = row - j0;
    double fx = col - i0;
    return (1 - fy) * ((1 - fx) * image(j0, i0) + fx * image(j0, i1))
           + fy * ((1 - fx) * image(j1, i0) + fx * image(j1, i1));
  }

  /**
   * Remap the image to polar coordinates around a center. Rows of the result
   * correspond to the azimuth angles, columns to the radii. The azimuth is
   * measured from the direction of increasing columns towards increasing
   * rows.
   * @param image The image
   * @param beam_row The row coordinate of the center
   * @param beam_col The column coordinate of the center
   * @param radii The radii (pixels)
   * @param phis The azimuth angles (radians)
   * @returns The polar image
   */
  inline image_type polar_pixel(const image_type &image,
                                double beam_row,
                                double beam_col,
                                const vector_type &radii,
                                const vector_type &phis) {
    image_type result(phis.size(), radii.size());
    for (Eigen::Index k = 0; k < phis.size(); ++k) {
      double s = std::sin(phis[k]);
      double c = std::cos(phis[k]);
      for (Eigen::Index l = 0; l < radii.size(); ++l) {
        result(k, l) = interpolate(image, beam_row + radii[l] * s, beam_col + radii[l] * c);
      }
    }
    return result;
  }

  /**
   * Remap the image to polar coordinates with momentum transfer as the
   * radial coordinate.
   * @param image The image
   * @param geometry The experimental geometry
   * @param qs The momentum transfer values
   * @param phis The azimuth angles (radians)
   * @returns The polar image
   */
  inline image_type polar_q(const image_type &image,
                            const Geometry &geometry,
                            const vector_type &qs,
                            const vector_type &phis) {
    AbscissaTransform transform(geometry, AbscissaKind::Q);
    vector_type radii(qs.size());
    for (Eigen::Index l = 0; l < qs.size(); ++l) {
      radii[l] = transform.inverse(qs[l]);
    }
    return polar_pixel(image, geometry.beam_row(), geometry.beam_col(), radii, phis);
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_POLAR_H

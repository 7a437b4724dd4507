/*
 * geometry_corrections.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_CORRECTIONS_GEOMETRY_CORRECTIONS_H
#define CREDO_ALGORITHMS_CORRECTIONS_GEOMETRY_CORRECTIONS_H

#include <cmath>
#include <cstddef>
#include <credo/algorithms/integration/abscissa_transform.h>
#include <credo/array_family/image_types.h>
#include <credo/error.h>

namespace credo { namespace algorithms {

  /**
   * A per-pixel matrix with its absolute uncertainty. Corrections are
   * applied by multiplying the intensity with the value.
   */
  struct CorrectionMatrix {
    image_type value;
    image_type error;
  };

  /**
   * The scattering angle 2theta (radians) of every pixel, with uncertainty
   * @param geometry The experimental geometry
   * @param rows The number of rows
   * @param cols The number of columns
   */
  inline CorrectionMatrix two_theta_matrix(const Geometry &geometry,
                                           std::size_t rows,
                                           std::size_t cols) {
    AbscissaTransform transform(geometry, AbscissaKind::TwoTheta);
    CorrectionMatrix result;
    result.value.resize(rows, cols);
    result.error.resize(rows, cols);
    for (std::size_t j = 0; j < rows; ++j) {
      for (std::size_t i = 0; i < cols; ++i) {
        ValueWithError tth = transform.at_pixel(j, i);
        result.value(j, i) = tth.value;
        result.error(j, i) = tth.error;
      }
    }
    return result;
  }

  /**
   * Solid angle correction, normalising each pixel to the solid angle seen
   * by a pixel at the beam center.
   * @param tth The scattering angle matrix
   * @param geometry The experimental geometry
   */
  inline CorrectionMatrix solid_angle(const CorrectionMatrix &tth,
                                      const Geometry &geometry) {
    CREDO_INPUT_ASSERT(all_eq(tth.value, tth.error), "value and error shapes differ");
    double d = geometry.distance();
    double sd = geometry.distance_error();
    double ps = geometry.pixel_size();
    double sps = geometry.pixel_size_error();
    CREDO_INPUT_ASSERT(d > 0 && ps > 0, "distance and pixel size must be positive");
    CorrectionMatrix result;
    result.value.resize(tth.value.rows(), tth.value.cols());
    result.error.resize(tth.value.rows(), tth.value.cols());
    for (Eigen::Index j = 0; j < tth.value.rows(); ++j) {
      for (Eigen::Index i = 0; i < tth.value.cols(); ++i) {
        double t = tth.value(j, i);
        double c = std::cos(t);
        double sac = d * d / (c * c * c) / (ps * ps);
        double tn = std::tan(t);
        result.value(j, i) = sac;
        result.error(j, i) =
          sac
          * std::sqrt(4 * sd * sd / (d * d) + 4 * sps * sps / (ps * ps)
                      + 9 * tth.error(j, i) * tth.error(j, i) * tn * tn);
      }
    }
    return result;
  }

  /**
   * Correction for the angle dependent self-absorption of a plate-like
   * sample perpendicular to the beam.
   * @param tth The scattering angle matrix
   * @param transmission The transmission of the sample (0 < T <= 1)
   * @param transmission_error The uncertainty of the transmission
   */
  inline CorrectionMatrix angle_dependent_absorption(const CorrectionMatrix &tth,
                                                     double transmission,
                                                     double transmission_error) {
    CREDO_INPUT_ASSERT(all_eq(tth.value, tth.error), "value and error shapes differ");
    CREDO_INPUT_ASSERT(transmission > 0 && transmission <= 1,
                       "transmission must be in (0, 1]");
    CorrectionMatrix result;
    result.value = image_type::Ones(tth.value.rows(), tth.value.cols());
    result.error = image_type::Zero(tth.value.rows(), tth.value.cols());
    if (transmission == 1) {
      return result;
    }
    double mud = -std::log(transmission);
    double lntrans = std::log(transmission);
    double st = transmission_error;
    for (Eigen::Index j = 0; j < tth.value.rows(); ++j) {
      for (Eigen::Index i = 0; i < tth.value.cols(); ++i) {
        double t = tth.value(j, i);
        double dt = tth.error(j, i);
        if (!(t > 0)) {
          continue;
        }
        double costth = std::cos(t);
        double sintth = std::sin(t);
        double exp1 = std::exp(lntrans / costth);
        result.value(j, i) = transmission * mud * (1 - 1 / costth)
                             / (std::exp(-mud / costth) - transmission);
        double a = transmission * costth - exp1 * lntrans * costth + exp1 * lntrans
                   - exp1 * costth;
        double b = transmission * transmission * dt * dt * lntrans * lntrans * sintth * sintth
                   + st * st * std::pow(sintth, 4) - 3 * st * st * sintth * sintth
                   - 2 * st * st * std::pow(costth, 3) + 2 * st * st;
        double denominator = std::pow(transmission - exp1, 4);
        result.error(j, i) =
          std::sqrt(std::fabs(a * a * b / denominator)) * std::pow(std::fabs(costth), -3.0);
      }
    }
    return result;
  }

  /**
   * Correction for the absorption of the air in the scattered beam path.
   * 1/mu0_air and the distance must be in the same length units.
   * @param tth The scattering angle matrix
   * @param pressure The air pressure (mbar)
   * @param geometry The experimental geometry
   * @param mu0_air Linear absorption coefficient of air at 1000 mbar (1/mm)
   * @param mu0_air_error The uncertainty of mu0_air
   */
  inline CorrectionMatrix angle_dependent_air_transmission(const CorrectionMatrix &tth,
                                                           double pressure,
                                                           const Geometry &geometry,
                                                           double mu0_air = 1 / 883.49,
                                                           double mu0_air_error = 0) {
    CREDO_INPUT_ASSERT(all_eq(tth.value, tth.error), "value and error shapes differ");
    double d = geometry.distance();
    double sd = geometry.distance_error();
    double mu = mu0_air / 1000 * pressure;
    double smu = mu0_air_error / 1000 * pressure;
    CorrectionMatrix result;
    result.value.resize(tth.value.rows(), tth.value.cols());
    result.error.resize(tth.value.rows(), tth.value.cols());
    for (Eigen::Index j = 0; j < tth.value.rows(); ++j) {
      for (Eigen::Index i = 0; i < tth.value.cols(); ++i) {
        double c = std::cos(tth.value(j, i));
        double s = std::sin(tth.value(j, i));
        double dt = tth.error(j, i);
        double e = std::exp(mu * d / c);
        result.value(j, i) = e;
        // The partial derivatives with respect to mu, d and 2theta
        double a = smu * d * e / c;
        double b = sd * mu * e / c;
        double g = dt * mu * d * e * s / (c * c);
        result.error(j, i) = std::sqrt(a * a + b * b + g * g);
      }
    }
    return result;
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_CORRECTIONS_GEOMETRY_CORRECTIONS_H

/*
 * abscissa_transform.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_ABSCISSA_TRANSFORM_H
#define CREDO_ALGORITHMS_INTEGRATION_ABSCISSA_TRANSFORM_H

#include <cmath>
#include <credo/error.h>
#include <credo/model/geometry.h>
#include <credo/model/modes.h>

namespace credo { namespace algorithms {

  using model::AbscissaKind;
  using model::Geometry;

  /**
   * A value with its absolute uncertainty
   */
  struct ValueWithError {
    double value;
    double error;

    ValueWithError() : value(0), error(0) {}
    ValueWithError(double value_, double error_) : value(value_), error(error_) {}
  };

  /**
   * Converts the distance of a pixel from the beam center to the detector
   * radius, the scattering angle or the momentum transfer, propagating the
   * uncertainties of the geometry at each step.
   */
  class AbscissaTransform {
  public:
    /**
     * Check that the geometry is usable for the given abscissa kind.
     * @param geometry The experimental geometry
     * @param kind The abscissa kind
     */
    AbscissaTransform(const Geometry &geometry, AbscissaKind kind)
        : geometry_(geometry), kind_(kind) {
      CREDO_INPUT_ASSERT(std::isfinite(geometry.beam_row())
                           && std::isfinite(geometry.beam_col()),
                         "beam center must be finite");
      switch (kind) {
      case AbscissaKind::Q:
        CREDO_INPUT_ASSERT(geometry.wavelength() > 0, "wavelength must be positive");
        [[fallthrough]];
      case AbscissaKind::TwoTheta:
        CREDO_INPUT_ASSERT(geometry.distance() > 0,
                           "sample-to-detector distance must be positive");
        [[fallthrough]];
      case AbscissaKind::DetectorRadius:
        CREDO_INPUT_ASSERT(geometry.pixel_size() > 0, "pixel size must be positive");
        [[fallthrough]];
      case AbscissaKind::Pixel:
        return;
      }
      CREDO_CONFIGURATION_ERROR("unknown abscissa kind");
    }

    AbscissaKind kind() const {
      return kind_;
    }

    const Geometry &geometry() const {
      return geometry_;
    }

    /**
     * The distance of a pixel from the beam center, in pixels. The
     * uncertainty comes from the uncertainty of the beam center and is zero
     * at the beam center itself.
     * @param row The row index
     * @param col The column index
     */
    ValueWithError pixel_radius(double row, double col) const {
      double dr = row - geometry_.beam_row();
      double dc = col - geometry_.beam_col();
      double rho = std::sqrt(dr * dr + dc * dc);
      if (rho == 0) {
        return ValueWithError(0, 0);
      }
      double srow = geometry_.beam_row_error();
      double scol = geometry_.beam_col_error();
      return ValueWithError(
        rho, std::sqrt(dr * dr * srow * srow + dc * dc * scol * scol) / rho);
    }

    /** The pixel radius without its uncertainty */
    double pixel_radius_value(double row, double col) const {
      double dr = row - geometry_.beam_row();
      double dc = col - geometry_.beam_col();
      return std::sqrt(dr * dr + dc * dc);
    }

    /**
     * Transform a pixel radius to the abscissa
     * @param rho The pixel radius with its uncertainty
     * @returns The abscissa value with its uncertainty
     */
    ValueWithError operator()(const ValueWithError &rho) const {
      switch (kind_) {
      case AbscissaKind::Pixel:
        return rho;
      case AbscissaKind::DetectorRadius:
        return detector_radius(rho);
      case AbscissaKind::TwoTheta:
        return two_theta(detector_radius(rho));
      case AbscissaKind::Q:
        return q(two_theta(detector_radius(rho)));
      }
      CREDO_CONFIGURATION_ERROR("unknown abscissa kind");
    }

    /**
     * Transform a pixel radius to the abscissa, ignoring uncertainties
     */
    double value(double rho) const {
      double ps = geometry_.pixel_size();
      switch (kind_) {
      case AbscissaKind::Pixel:
        return rho;
      case AbscissaKind::DetectorRadius:
        return rho * ps;
      case AbscissaKind::TwoTheta:
        return std::atan(rho * ps / geometry_.distance());
      case AbscissaKind::Q:
        return 4 * M_PI * std::sin(0.5 * std::atan(rho * ps / geometry_.distance()))
               / geometry_.wavelength();
      }
      CREDO_CONFIGURATION_ERROR("unknown abscissa kind");
    }

    /**
     * The abscissa of a pixel, with its uncertainty
     * @param row The row index
     * @param col The column index
     */
    ValueWithError at_pixel(double row, double col) const {
      return (*this)(pixel_radius(row, col));
    }

    /**
     * Convert an abscissa value back to a pixel radius. This is the exact
     * inverse of value().
     * @param x The abscissa value
     * @returns The pixel radius
     */
    double inverse(double x) const {
      double ps = geometry_.pixel_size();
      switch (kind_) {
      case AbscissaKind::Pixel:
        return x;
      case AbscissaKind::DetectorRadius:
        return x / ps;
      case AbscissaKind::TwoTheta:
        return geometry_.distance() / ps * std::tan(x);
      case AbscissaKind::Q:
        return geometry_.distance() / ps
               * std::tan(2 * std::asin(x * geometry_.wavelength() / (4 * M_PI)));
      }
      CREDO_CONFIGURATION_ERROR("unknown abscissa kind");
    }

    /**
     * Pixel radius to distance on the detector (mm)
     */
    ValueWithError detector_radius(const ValueWithError &rho) const {
      double ps = geometry_.pixel_size();
      double sps = geometry_.pixel_size_error();
      double a = rho.error * ps;
      double b = rho.value * sps;
      return ValueWithError(rho.value * ps, std::sqrt(a * a + b * b));
    }

    /**
     * Detector radius to scattering angle (radians)
     */
    ValueWithError two_theta(const ValueWithError &r) const {
      double d = geometry_.distance();
      double sd = geometry_.distance_error();
      double denominator = d * d + r.value * r.value;
      double a = d / denominator * r.error;
      double b = r.value / denominator * sd;
      return ValueWithError(std::atan(r.value / d), std::sqrt(a * a + b * b));
    }

    /**
     * Scattering angle to momentum transfer (1/wavelength units)
     */
    ValueWithError q(const ValueWithError &tth) const {
      double wl = geometry_.wavelength();
      double swl = geometry_.wavelength_error();
      double value = 4 * M_PI * std::sin(0.5 * tth.value) / wl;
      double a = 2 * M_PI / wl * std::cos(0.5 * tth.value) * tth.error;
      double b = value / wl * swl;
      return ValueWithError(value, std::sqrt(a * a + b * b));
    }

  private:
    Geometry geometry_;
    AbscissaKind kind_;
  };

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_ABSCISSA_TRANSFORM_H

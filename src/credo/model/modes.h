/*
 * modes.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_MODEL_MODES_H
#define CREDO_MODEL_MODES_H

#include <string>
#include <credo/error.h>

namespace credo { namespace model {

  /**
   * The physical quantity on the abscissa of a reduced curve. Each kind
   * applies one further transform to the previous one.
   */
  enum class AbscissaKind { Pixel, DetectorRadius, TwoTheta, Q };

  /**
   * How per-pixel values and their uncertainties are combined in a bin.
   *
   *  Weighted:     y = sum(y_i / e_i^2) / sum(1 / e_i^2), e = 1 / sqrt(sum(1 / e_i^2))
   *  Average:      y = mean(y_i), e = sum(e_i) / N
   *  Gaussian:     y = mean(y_i), e = sqrt(sum(e_i^2)) / N
   *  Conservative: y = mean(y_i), e = the larger of the Gaussian error and the
   *                standard error of the mean
   */
  enum class ErrorPropagation { Weighted, Average, Gaussian, Conservative };

  /** How a rasterized shape combines with the existing mask */
  enum class MaskingMode { Mask, Unmask, Flip };

  /** Spacing of automatically determined bin edges */
  enum class RangeSpacing { Linear, Logarithmic };

  inline const char *to_string(AbscissaKind kind) {
    switch (kind) {
    case AbscissaKind::Pixel:
      return "Pixel";
    case AbscissaKind::DetectorRadius:
      return "DetectorRadius";
    case AbscissaKind::TwoTheta:
      return "TwoTheta";
    case AbscissaKind::Q:
      return "Q";
    }
    CREDO_CONFIGURATION_ERROR("unknown abscissa kind");
  }

  inline const char *to_string(ErrorPropagation method) {
    switch (method) {
    case ErrorPropagation::Weighted:
      return "Weighted";
    case ErrorPropagation::Average:
      return "Average";
    case ErrorPropagation::Gaussian:
      return "Gaussian";
    case ErrorPropagation::Conservative:
      return "Conservative";
    }
    CREDO_CONFIGURATION_ERROR("unknown error propagation method");
  }

  inline const char *to_string(RangeSpacing spacing) {
    switch (spacing) {
    case RangeSpacing::Linear:
      return "Linear";
    case RangeSpacing::Logarithmic:
      return "Logarithmic";
    }
    CREDO_CONFIGURATION_ERROR("unknown range spacing");
  }

  inline AbscissaKind abscissa_kind_from_string(const std::string &name) {
    if (name == "Pixel") return AbscissaKind::Pixel;
    if (name == "DetectorRadius") return AbscissaKind::DetectorRadius;
    if (name == "TwoTheta") return AbscissaKind::TwoTheta;
    if (name == "Q") return AbscissaKind::Q;
    CREDO_CONFIGURATION_ERROR("unknown abscissa kind: " + name);
  }

  /**
   * Parse an error propagation method. "Linear" is accepted as an alias of
   * "Average".
   */
  inline ErrorPropagation error_propagation_from_string(const std::string &name) {
    if (name == "Weighted") return ErrorPropagation::Weighted;
    if (name == "Average" || name == "Linear") return ErrorPropagation::Average;
    if (name == "Gaussian") return ErrorPropagation::Gaussian;
    if (name == "Conservative") return ErrorPropagation::Conservative;
    CREDO_CONFIGURATION_ERROR("unknown error propagation method: " + name);
  }

  inline RangeSpacing range_spacing_from_string(const std::string &name) {
    if (name == "Linear") return RangeSpacing::Linear;
    if (name == "Logarithmic") return RangeSpacing::Logarithmic;
    CREDO_CONFIGURATION_ERROR("unknown range spacing: " + name);
  }

}}  // namespace credo::model

#endif /* CREDO_MODEL_MODES_H */

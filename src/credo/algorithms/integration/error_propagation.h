/*
 * error_propagation.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_INTEGRATION_ERROR_PROPAGATION_H
#define CREDO_ALGORITHMS_INTEGRATION_ERROR_PROPAGATION_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <credo/error.h>
#include <credo/model/modes.h>

namespace credo { namespace algorithms {

  using model::ErrorPropagation;

  /**
   * Check that an error propagation method is one of the known ones.
   */
  inline void check_error_propagation(ErrorPropagation method) {
    switch (method) {
    case ErrorPropagation::Weighted:
    case ErrorPropagation::Average:
    case ErrorPropagation::Gaussian:
    case ErrorPropagation::Conservative:
      return;
    }
    CREDO_CONFIGURATION_ERROR("unknown error propagation method");
  }

  /**
   * Accumulates values with uncertainties and reduces them to a single
   * value and uncertainty according to an error propagation method.
   *
   * Which sums are kept depends on the method:
   *   Weighted:     value = sum(y / e^2), error = sum(1 / e^2)
   *   Average:      value = sum(y),       error = sum(e)
   *   Gaussian:     value = sum(y),       error = sum(e^2)
   *   Conservative: value = sum(y),       error = sum(e^2), value2 = sum(y^2)
   */
  class ErrorPropagationAccumulator {
  public:
    ErrorPropagationAccumulator() : value_(0), value2_(0), error_(0), count_(0) {}

    /**
     * Add a value
     * @param method The error propagation method
     * @param value The value
     * @param error The absolute uncertainty of the value
     */
    void add(ErrorPropagation method, double value, double error) {
      switch (method) {
      case ErrorPropagation::Weighted: {
        // Weights are undefined for non-positive uncertainties
        double e = (error > 0 && std::isfinite(error)) ? error : 1.0;
        double w = 1.0 / (e * e);
        value_ += value * w;
        error_ += w;
        break;
      }
      case ErrorPropagation::Average:
        value_ += value;
        error_ += error;
        break;
      case ErrorPropagation::Gaussian:
        value_ += value;
        error_ += error * error;
        break;
      case ErrorPropagation::Conservative:
        value_ += value;
        value2_ += value * value;
        error_ += error * error;
        break;
      default:
        CREDO_CONFIGURATION_ERROR("unknown error propagation method");
      }
      count_++;
    }

    /**
     * Add the partial sums of another accumulator
     */
    void merge(const ErrorPropagationAccumulator &other) {
      value_ += other.value_;
      value2_ += other.value2_;
      error_ += other.error_;
      count_ += other.count_;
    }

    /** The number of values added */
    std::size_t count() const {
      return count_;
    }

    /**
     * Reduce to a value and its uncertainty. An empty accumulator gives NaN
     * for both.
     * @param method The error propagation method
     * @param value The resulting value
     * @param error The resulting uncertainty
     */
    void result(ErrorPropagation method, double &value, double &error) const {
      if (count_ == 0) {
        value = error = std::numeric_limits<double>::quiet_NaN();
        return;
      }
      double n = static_cast<double>(count_);
      switch (method) {
      case ErrorPropagation::Weighted:
        value = value_ / error_;
        error = std::sqrt(1.0 / error_);
        return;
      case ErrorPropagation::Average:
        value = value_ / n;
        error = error_ / n;
        return;
      case ErrorPropagation::Gaussian:
        value = value_ / n;
        error = std::sqrt(error_) / n;
        return;
      case ErrorPropagation::Conservative: {
        value = value_ / n;
        double error_std = 0;
        if (count_ > 1) {
          double variance = std::max(0.0, (value2_ - value_ * value_ / n) / (n - 1));
          error_std = std::sqrt(variance) / std::sqrt(n);
        }
        double error_propagated = std::sqrt(error_) / n;
        error = std::max(error_std, error_propagated);
        return;
      }
      }
      CREDO_CONFIGURATION_ERROR("unknown error propagation method");
    }

  private:
    double value_;
    double value2_;
    double error_;
    std::size_t count_;
  };

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_INTEGRATION_ERROR_PROPAGATION_H

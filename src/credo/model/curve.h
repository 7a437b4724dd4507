/*
 * curve.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_MODEL_CURVE_H
#define CREDO_MODEL_CURVE_H

#include <cstddef>
#include <limits>
#include <credo/array_family/image_types.h>
#include <credo/error.h>

namespace credo { namespace model {

  /**
   * Counts of the pixels which were not accumulated into any bin, by the
   * reason they were dropped. Each pixel is counted under the first reason
   * that applies.
   */
  struct PixelTally {
    std::size_t masked;
    std::size_t invalid_intensity;
    std::size_t invalid_error;
    std::size_t invalid_abscissa;
    std::size_t underflow;
    std::size_t overflow;

    PixelTally()
        : masked(0),
          invalid_intensity(0),
          invalid_error(0),
          invalid_abscissa(0),
          underflow(0),
          overflow(0) {}

    /** The number of dropped pixels */
    std::size_t total() const {
      return masked + invalid_intensity + invalid_error + invalid_abscissa
             + underflow + overflow;
    }

    PixelTally &operator+=(const PixelTally &other) {
      masked += other.masked;
      invalid_intensity += other.invalid_intensity;
      invalid_error += other.invalid_error;
      invalid_abscissa += other.invalid_abscissa;
      underflow += other.underflow;
      overflow += other.overflow;
      return *this;
    }
  };

  /**
   * A reduced one-dimensional scattering curve. All arrays are index aligned.
   * Bins with zero area hold NaN in every value field.
   */
  class Curve {
  public:
    Curve() {}

    /**
     * Allocate a curve of empty bins
     * @param size The number of bins
     */
    explicit Curve(std::size_t size)
        : abscissa_(vector_type::Constant(size, nan())),
          abscissa_error_(vector_type::Constant(size, nan())),
          intensity_(vector_type::Constant(size, nan())),
          intensity_error_(vector_type::Constant(size, nan())),
          area_(count_vector_type::Zero(size)) {}

    std::size_t size() const {
      return abscissa_.size();
    }

    /** The average abscissa in each bin */
    const vector_type &abscissa() const {
      return abscissa_;
    }

    const vector_type &abscissa_error() const {
      return abscissa_error_;
    }

    const vector_type &intensity() const {
      return intensity_;
    }

    const vector_type &intensity_error() const {
      return intensity_error_;
    }

    /** The number of pixels in each bin */
    const count_vector_type &area() const {
      return area_;
    }

    /** The pixels not accumulated into any bin */
    const PixelTally &tally() const {
      return tally_;
    }

    /** The number of pixels accumulated into bins */
    std::size_t total_area() const {
      std::size_t total = 0;
      for (Eigen::Index i = 0; i < area_.size(); ++i) {
        total += area_[i];
      }
      return total;
    }

    /**
     * Set the contents of a bin.
     */
    void set_bin(std::size_t index,
                 double abscissa,
                 double abscissa_error,
                 double intensity,
                 double intensity_error,
                 std::size_t area) {
      CREDO_ASSERT(index < size());
      abscissa_[index] = abscissa;
      abscissa_error_[index] = abscissa_error;
      intensity_[index] = intensity;
      intensity_error_[index] = intensity_error;
      area_[index] = area;
    }

    void set_tally(const PixelTally &tally) {
      tally_ = tally;
    }

  private:
    static double nan() {
      return std::numeric_limits<double>::quiet_NaN();
    }

    vector_type abscissa_;
    vector_type abscissa_error_;
    vector_type intensity_;
    vector_type intensity_error_;
    count_vector_type area_;
    PixelTally tally_;
  };

  /**
   * An azimuthal curve: intensity against the azimuth angle (in radians,
   * [0, 2pi)) together with the mean and spread of q in each sector.
   */
  class AzimuthalCurve : public Curve {
  public:
    AzimuthalCurve() {}

    explicit AzimuthalCurve(std::size_t size)
        : Curve(size),
          q_mean_(vector_type::Constant(size, std::numeric_limits<double>::quiet_NaN())),
          q_std_(vector_type::Constant(size, std::numeric_limits<double>::quiet_NaN())) {}

    /** The azimuth angle of each bin */
    const vector_type &phi() const {
      return abscissa();
    }

    const vector_type &phi_error() const {
      return abscissa_error();
    }

    const vector_type &q_mean() const {
      return q_mean_;
    }

    const vector_type &q_std() const {
      return q_std_;
    }

    void set_q(std::size_t index, double mean, double std) {
      CREDO_ASSERT(index < size());
      q_mean_[index] = mean;
      q_std_[index] = std;
    }

  private:
    vector_type q_mean_;
    vector_type q_std_;
  };

}}  // namespace credo::model

#endif /* CREDO_MODEL_CURVE_H */

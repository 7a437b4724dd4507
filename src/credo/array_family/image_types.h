/*
 * image_types.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ARRAY_FAMILY_IMAGE_TYPES_H
#define CREDO_ARRAY_FAMILY_IMAGE_TYPES_H

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <Eigen/Dense>
#include <credo/error.h>

namespace credo {

  /** A detector image (or its per-pixel uncertainty), row major */
  typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>
    image_type;

  /** A pixel mask: nonzero is valid, zero is masked */
  typedef Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>
    mask_type;

  /** A one dimensional array of doubles */
  typedef Eigen::VectorXd vector_type;

  /** Per-bin pixel counts */
  typedef Eigen::Matrix<std::size_t, Eigen::Dynamic, 1> count_vector_type;

  /**
   * Check that two 2D arrays have the same shape.
   */
  template <typename A, typename B>
  bool all_eq(const Eigen::DenseBase<A> &a, const Eigen::DenseBase<B> &b) {
    return a.rows() == b.rows() && a.cols() == b.cols();
  }

  /**
   * Make a mask with all pixels valid.
   * @param rows The number of rows
   * @param cols The number of columns
   * @returns The mask
   */
  inline mask_type unmasked(std::size_t rows, std::size_t cols) {
    return mask_type::Ones(rows, cols);
  }

  /**
   * Fill a vector with linearly spaced values (both ends included).
   */
  inline vector_type linspace(double first, double last, std::size_t count) {
    vector_type result(count);
    if (count == 1) {
      result[0] = first;
      return result;
    }
    double step = (last - first) / (count - 1);
    for (std::size_t i = 0; i < count; ++i) {
      result[i] = first + i * step;
    }
    if (count > 0) {
      result[count - 1] = last;
    }
    return result;
  }

  /**
   * Fill a vector with logarithmically spaced values (both ends included).
   */
  inline vector_type logspace(double first, double last, std::size_t count) {
    CREDO_INPUT_ASSERT(first > 0 && last > 0,
                       "logarithmic spacing needs positive limits");
    vector_type exponents = linspace(std::log10(first), std::log10(last), count);
    vector_type result(count);
    for (std::size_t i = 0; i < count; ++i) {
      result[i] = std::pow(10.0, exponents[i]);
    }
    if (count > 0) {
      result[0] = first;
      result[count - 1] = last;
    }
    return result;
  }

}  // namespace credo

#endif /* CREDO_ARRAY_FAMILY_IMAGE_TYPES_H */

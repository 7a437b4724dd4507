/*
 * mask_shapes.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ALGORITHMS_MASKING_MASK_SHAPES_H
#define CREDO_ALGORITHMS_MASKING_MASK_SHAPES_H

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>
#include <Eigen/Dense>
#include <credo/array_family/image_types.h>
#include <credo/error.h>
#include <credo/model/modes.h>

namespace credo { namespace algorithms {

  using model::MaskingMode;

  /** Polygon vertices as (x = column, y = row) pairs */
  typedef std::vector<Eigen::Vector2d> polygon_type;

  namespace detail {

    /**
     * Apply the masking mode to a single pixel
     */
    inline void apply_mode(std::uint8_t &value, MaskingMode mode) {
      switch (mode) {
      case MaskingMode::Mask:
        value = 0;
        return;
      case MaskingMode::Unmask:
        value = 1;
        return;
      case MaskingMode::Flip:
        value = value ? 0 : 1;
        return;
      }
      CREDO_CONFIGURATION_ERROR("unknown masking mode");
    }

    /**
     * Check the mode before touching the mask so that an invalid value does
     * not leave a partially edited mask behind.
     */
    inline void check_mode(MaskingMode mode) {
      switch (mode) {
      case MaskingMode::Mask:
      case MaskingMode::Unmask:
      case MaskingMode::Flip:
        return;
      }
      CREDO_CONFIGURATION_ERROR("unknown masking mode");
    }

    /**
     * Clip a floating point index range to [0, size)
     */
    inline void clip_range(double first,
                           double last,
                           std::size_t size,
                           std::size_t &begin,
                           std::size_t &end) {
      first = std::max(first, 0.0);
      last = std::min(last, static_cast<double>(size));
      if (!(first < last)) {
        begin = end = 0;
        return;
      }
      begin = static_cast<std::size_t>(first);
      end = static_cast<std::size_t>(last);
    }

  }  // namespace detail

  /**
   * Mask, unmask or flip the pixels inside a circle. A pixel is inside when
   * its center is not farther from the circle center than the radius.
   * @param mask The mask to modify
   * @param center_row The row coordinate of the circle center
   * @param center_col The column coordinate of the circle center
   * @param radius The radius of the circle (in pixels)
   * @param mode The masking mode
   * @returns The modified mask
   */
  inline mask_type &mask_circle(mask_type &mask,
                                double center_row,
                                double center_col,
                                double radius,
                                MaskingMode mode) {
    detail::check_mode(mode);
    if (!(radius > 0)) {
      return mask;
    }
    std::size_t row_begin, row_end, col_begin, col_end;
    detail::clip_range(std::floor(center_row - radius) - 1,
                       std::ceil(center_row + radius) + 2,
                       mask.rows(),
                       row_begin,
                       row_end);
    detail::clip_range(std::floor(center_col - radius) - 1,
                       std::ceil(center_col + radius) + 2,
                       mask.cols(),
                       col_begin,
                       col_end);
    double r2 = radius * radius;
    for (std::size_t j = row_begin; j < row_end; ++j) {
      double dr = j - center_row;
      for (std::size_t i = col_begin; i < col_end; ++i) {
        double dc = i - center_col;
        if (dr * dr + dc * dc <= r2) {
          detail::apply_mode(mask(j, i), mode);
        }
      }
    }
    return mask;
  }

  /**
   * Mask, unmask or flip the pixels inside a rectangle. Pixels are unit
   * squares centred on integer coordinates, and the rectangle selects the
   * rows ceil(row_min + 0.5) - 1 <= row < ceil(row_max - 0.5) - 1 (columns
   * alike), so that (1, 1, 4, 4) selects the 2x2 block at rows and columns
   * {1, 2}.
   * @param mask The mask to modify
   * @param row_min The first row coordinate of the rectangle
   * @param col_min The first column coordinate of the rectangle
   * @param row_max The second row coordinate of the rectangle
   * @param col_max The second column coordinate of the rectangle
   * @param mode The masking mode
   * @returns The modified mask
   */
  inline mask_type &mask_rectangle(mask_type &mask,
                                   double row_min,
                                   double col_min,
                                   double row_max,
                                   double col_max,
                                   MaskingMode mode) {
    detail::check_mode(mode);
    if (row_min > row_max) std::swap(row_min, row_max);
    if (col_min > col_max) std::swap(col_min, col_max);
    std::size_t row_begin, row_end, col_begin, col_end;
    detail::clip_range(std::ceil(row_min + 0.5) - 1,
                       std::ceil(row_max - 0.5) - 1,
                       mask.rows(),
                       row_begin,
                       row_end);
    detail::clip_range(std::ceil(col_min + 0.5) - 1,
                       std::ceil(col_max - 0.5) - 1,
                       mask.cols(),
                       col_begin,
                       col_end);
    for (std::size_t j = row_begin; j < row_end; ++j) {
      for (std::size_t i = col_begin; i < col_end; ++i) {
        detail::apply_mode(mask(j, i), mode);
      }
    }
    return mask;
  }

  /**
   * Mask, unmask or flip the pixels inside a polygon using the even-odd
   * rule. The polygon must be closed explicitly: the last vertex repeats the
   * first one, no edge is assumed between them otherwise.
   * @param mask The mask to modify
   * @param vertices The (column, row) coordinates of the vertices
   * @param mode The masking mode
   * @returns The modified mask
   */
  inline mask_type &mask_polygon(mask_type &mask,
                                 const polygon_type &vertices,
                                 MaskingMode mode) {
    detail::check_mode(mode);
    if (vertices.size() < 3) {
      return mask;
    }

    // Restrict the scan to the bounding box of the polygon
    double xmin = vertices[0].x(), xmax = vertices[0].x();
    double ymin = vertices[0].y(), ymax = vertices[0].y();
    for (std::size_t k = 1; k < vertices.size(); ++k) {
      xmin = std::min(xmin, vertices[k].x());
      xmax = std::max(xmax, vertices[k].x());
      ymin = std::min(ymin, vertices[k].y());
      ymax = std::max(ymax, vertices[k].y());
    }
    std::size_t row_begin, row_end, col_begin, col_end;
    detail::clip_range(std::floor(ymin), std::ceil(ymax) + 1, mask.rows(), row_begin, row_end);
    detail::clip_range(std::floor(xmin), std::ceil(xmax) + 1, mask.cols(), col_begin, col_end);

    for (std::size_t j = row_begin; j < row_end; ++j) {
      for (std::size_t i = col_begin; i < col_end; ++i) {
        std::size_t crossings = 0;
        for (std::size_t k = 0; k + 1 < vertices.size(); ++k) {
          const Eigen::Vector2d &a = vertices[k];
          const Eigen::Vector2d &b = vertices[k + 1];
          if (a.y() == b.y()) {
            continue;
          }
          double t = (j - a.y()) / (b.y() - a.y());
          if (t < 0 || t >= 1) {
            continue;
          }
          double x = a.x() + t * (b.x() - a.x());
          if (x >= static_cast<double>(i)) {
            crossings++;
          }
        }
        if (crossings % 2 == 1) {
          detail::apply_mode(mask(j, i), mode);
        }
      }
    }
    return mask;
  }

  /**
   * Make a copy of the mask in which pixels outside an annulus are masked.
   * @param mask The mask
   * @param center_row The row coordinate of the center
   * @param center_col The column coordinate of the center
   * @param r_min The inner radius (pixels)
   * @param r_max The outer radius (pixels)
   * @returns The new mask
   */
  inline mask_type mask_for_annulus(const mask_type &mask,
                                    double center_row,
                                    double center_col,
                                    double r_min,
                                    double r_max) {
    mask_type result = mask;
    double r2min = r_min * r_min;
    double r2max = r_max * r_max;
    for (Eigen::Index j = 0; j < result.rows(); ++j) {
      for (Eigen::Index i = 0; i < result.cols(); ++i) {
        double dr = j - center_row;
        double dc = i - center_col;
        double r2 = dr * dr + dc * dc;
        if (r2 < r2min || r2 > r2max) {
          result(j, i) = 0;
        }
      }
    }
    return result;
  }

  /**
   * The azimuth of a pixel around a center, in [0, 2pi). Zero points along
   * increasing columns and the angle grows towards increasing rows.
   */
  inline double pixel_azimuth(double row, double col, double center_row, double center_col) {
    double phi = std::atan2(row - center_row, col - center_col);
    if (phi < 0) {
      phi += 2 * M_PI;
    }
    return phi;
  }

  /**
   * Make a copy of the mask in which only the pixels within a sector (or, if
   * symmetric, also in the opposite sector) are left unmasked.
   * @param mask The mask
   * @param center_row The row coordinate of the center
   * @param center_col The column coordinate of the center
   * @param phi_center The azimuth of the sector centre (radians)
   * @param phi_half_width The half width of the sector (radians)
   * @param symmetric Also keep the sector at phi_center + pi
   * @returns The new mask
   */
  inline mask_type mask_for_sectors(const mask_type &mask,
                                    double center_row,
                                    double center_col,
                                    double phi_center,
                                    double phi_half_width,
                                    bool symmetric) {
    mask_type result = mask;
    for (Eigen::Index j = 0; j < result.rows(); ++j) {
      for (Eigen::Index i = 0; i < result.cols(); ++i) {
        double phi = pixel_azimuth(j, i, center_row, center_col);
        // angular distance folded into [0, pi]
        double d = std::fabs(std::remainder(phi - phi_center, 2 * M_PI));
        bool inside = d <= phi_half_width;
        if (symmetric && !inside) {
          double d2 = std::fabs(std::remainder(phi - phi_center - M_PI, 2 * M_PI));
          inside = d2 <= phi_half_width;
        }
        if (!inside) {
          result(j, i) = 0;
        }
      }
    }
    return result;
  }

}}  // namespace credo::algorithms

#endif  // CREDO_ALGORITHMS_MASKING_MASK_SHAPES_H

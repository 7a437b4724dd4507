#include <cmath>
#include <credo/algorithms/integration/fast_average.h>
#include <credo/algorithms/integration/polar.h>
#include <credo/error.h>
#include <gtest/gtest.h>

using credo::image_type;
using credo::mask_type;
using credo::unmasked;
using credo::vector_type;
using credo::algorithms::AbscissaTransform;
using credo::algorithms::fast_azimuthal_average;
using credo::algorithms::fast_radial_average;
using credo::algorithms::FastAverage;
using credo::algorithms::interpolate;
using credo::algorithms::polar_pixel;
using credo::algorithms::polar_q;
using credo::model::AbscissaKind;
using credo::model::Geometry;

namespace {

// The intensity equals the distance from (row, col)
image_type radial_ramp(std::size_t rows, std::size_t cols, double row,
                       double col) {
  image_type image(rows, cols);
  for (std::size_t j = 0; j < rows; ++j) {
    for (std::size_t i = 0; i < cols; ++i) {
      image(j, i) = std::hypot(j - row, i - col);
    }
  }
  return image;
}

// A plane, reproduced exactly by bilinear interpolation
image_type plane(std::size_t rows, std::size_t cols) {
  image_type image(rows, cols);
  for (std::size_t j = 0; j < rows; ++j) {
    for (std::size_t i = 0; i < cols; ++i) {
      image(j, i) = 10.0 * j + i;
    }
  }
  return image;
}

} // namespace

TEST(FastAverageTests, RadialAverage) {
  image_type image = radial_ramp(21, 21, 10, 10);
  FastAverage avg =
      fast_radial_average(image, unmasked(21, 21), 10, 10, 0, 10, 10);
  ASSERT_EQ(avg.area.size(), 10);

  std::size_t expected_area = 0;
  for (int j = 0; j < 21; ++j) {
    for (int i = 0; i < 21; ++i) {
      if (std::hypot(j - 10, i - 10) <= 10) {
        expected_area++;
      }
    }
  }
  EXPECT_EQ(avg.area.sum(), expected_area);
  // Only the center is closer than a pixel
  EXPECT_EQ(avg.area[0], 1u);
  for (int l = 0; l < 10; ++l) {
    ASSERT_GT(avg.area[l], 0u);
    EXPECT_NEAR(avg.intensity[l], avg.abscissa[l], 1e-12);
    EXPECT_GE(avg.abscissa[l], l);
    EXPECT_LE(avg.abscissa[l], l + 1);
  }
}

TEST(FastAverageTests, RadialAverageSkipsInvalidPixels) {
  image_type image = image_type::Ones(9, 9);
  image(4, 5) = NAN;
  mask_type mask = unmasked(9, 9);
  mask(5, 4) = 0;
  FastAverage avg = fast_radial_average(image, mask, 4, 4, 0.9, 1.9, 2);
  // Two of the four nearest neighbours remain
  EXPECT_EQ(avg.area[0], 2u);
  EXPECT_EQ(avg.intensity[0], 1);
  // The diagonals at sqrt(2)
  EXPECT_EQ(avg.area[1], 4u);
}

TEST(FastAverageTests, EmptyBinsAreNaN) {
  FastAverage avg =
      fast_radial_average(image_type::Ones(5, 5), unmasked(5, 5), 2, 2, 50, 60, 3);
  for (int l = 0; l < 3; ++l) {
    EXPECT_EQ(avg.area[l], 0u);
    EXPECT_TRUE(std::isnan(avg.intensity[l]));
    EXPECT_TRUE(std::isnan(avg.abscissa[l]));
  }
}

TEST(FastAverageTests, AzimuthalAverage) {
  image_type image = plane(5, 5);
  FastAverage avg = fast_azimuthal_average(image, unmasked(5, 5), 2, 2, 4);
  ASSERT_EQ(avg.area.size(), 4);
  // The center pixel has no azimuth
  EXPECT_EQ(avg.area.sum(), 24u);
  for (int l = 0; l < 4; ++l) {
    EXPECT_EQ(avg.area[l], 6u);
  }
  // Towards increasing columns and rows the plane rises
  EXPECT_DOUBLE_EQ(avg.intensity[0], 10 * (2 + 2 + 3 + 3 + 4 + 4) / 6.0 + 3.5);
  EXPECT_LT(avg.intensity[2], avg.intensity[0]);
}

TEST(FastAverageTests, InvalidInput) {
  EXPECT_THROW(fast_radial_average(image_type::Ones(5, 5), unmasked(5, 5), 2,
                                   2, 0, 3, 0),
               credo::input_error);
  EXPECT_THROW(fast_radial_average(image_type::Ones(5, 5), unmasked(5, 5), 2,
                                   2, 3, 3, 4),
               credo::input_error);
  EXPECT_THROW(fast_azimuthal_average(image_type::Ones(5, 5), unmasked(4, 5),
                                      2, 2, 4),
               credo::input_error);
}

TEST(PolarTests, Interpolate) {
  image_type image = plane(6, 7);
  EXPECT_DOUBLE_EQ(interpolate(image, 2, 3), 23);
  EXPECT_DOUBLE_EQ(interpolate(image, 2.5, 3.5), 28.5);
  EXPECT_DOUBLE_EQ(interpolate(image, 5, 6), 56);
  EXPECT_TRUE(std::isnan(interpolate(image, -0.1, 3)));
  EXPECT_TRUE(std::isnan(interpolate(image, 2, 6.01)));
}

TEST(PolarTests, PolarPixel) {
  image_type image = plane(21, 21);
  vector_type radii(2);
  radii << 5, 50;
  vector_type phis(2);
  phis << 0, M_PI / 2;
  image_type polar = polar_pixel(image, 10, 10, radii, phis);
  ASSERT_EQ(polar.rows(), 2);
  ASSERT_EQ(polar.cols(), 2);
  EXPECT_NEAR(polar(0, 0), 10 * 10 + 15, 1e-9);
  EXPECT_NEAR(polar(1, 0), 10 * 15 + 10, 1e-9);
  // Outside the detector
  EXPECT_TRUE(std::isnan(polar(0, 1)));
  EXPECT_TRUE(std::isnan(polar(1, 1)));
}

TEST(PolarTests, PolarQ) {
  Geometry geometry(10, 10, 1000, 0.172, 0.154);
  image_type image = plane(21, 21);
  AbscissaTransform transform(geometry, AbscissaKind::Q);
  vector_type qs(1);
  qs << transform.value(5);
  vector_type phis(1);
  phis << 0;
  image_type polar = polar_q(image, geometry, qs, phis);
  EXPECT_NEAR(polar(0, 0), 10 * 10 + 15, 1e-6);
}

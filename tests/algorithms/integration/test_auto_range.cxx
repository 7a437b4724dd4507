#include <cmath>
#include <credo/algorithms/integration/auto_range.h>
#include <credo/error.h>
#include <gtest/gtest.h>

using credo::mask_type;
using credo::unmasked;
using credo::algorithms::auto_range;
using credo::algorithms::AutoRange;
using credo::algorithms::default_bin_count;
using credo::model::AbscissaKind;
using credo::model::Geometry;
using credo::model::RangeSpacing;

TEST(AutoRangeTests, DefaultBinCount) {
  EXPECT_EQ(default_bin_count(3, 4), 3u);
  EXPECT_EQ(default_bin_count(4, 4), 3u);
  EXPECT_EQ(default_bin_count(1, 1), 1u);
  EXPECT_EQ(default_bin_count(1043, 981), 716u);
}

TEST(AutoRangeTests, LinearPixel) {
  Geometry geometry(0, 0, 1000, 0.172, 0.154);
  AutoRange r =
      auto_range(geometry, unmasked(4, 4), AbscissaKind::Pixel, RangeSpacing::Linear);
  EXPECT_FALSE(r.degenerate);
  EXPECT_EQ(r.spacing_used, RangeSpacing::Linear);
  EXPECT_EQ(r.min, 0);
  EXPECT_DOUBLE_EQ(r.max, std::sqrt(18.0));
  ASSERT_EQ(r.edges.size(), 3);
  EXPECT_EQ(r.edges[0], 0);
  EXPECT_DOUBLE_EQ(r.edges[1], std::sqrt(18.0) / 2);
  EXPECT_EQ(r.edges[2], r.max);
}

TEST(AutoRangeTests, ExplicitCount) {
  Geometry geometry(0, 0, 1000, 0.172, 0.154);
  AutoRange r = auto_range(geometry, unmasked(4, 4), AbscissaKind::Pixel,
                           RangeSpacing::Linear, 7);
  EXPECT_EQ(r.edges.size(), 7);
}

// The range only covers valid pixels
TEST(AutoRangeTests, MaskedPixelsIgnored) {
  Geometry geometry(0, 0, 1000, 0.172, 0.154);
  mask_type mask = mask_type::Zero(4, 4);
  mask(3, 3) = 1;
  AutoRange r =
      auto_range(geometry, mask, AbscissaKind::Pixel, RangeSpacing::Linear);
  EXPECT_FALSE(r.degenerate);
  EXPECT_DOUBLE_EQ(r.min, std::sqrt(18.0));
  EXPECT_DOUBLE_EQ(r.max, std::sqrt(18.0));
  for (Eigen::Index k = 0; k < r.edges.size(); ++k) {
    EXPECT_DOUBLE_EQ(r.edges[k], std::sqrt(18.0));
  }
}

TEST(AutoRangeTests, Logarithmic) {
  // Beam center off the detector, so every radius is positive
  Geometry geometry(-10, -10, 1000, 0.172, 0.154);
  AutoRange r = auto_range(geometry, unmasked(4, 4), AbscissaKind::Q,
                           RangeSpacing::Logarithmic, 5);
  EXPECT_FALSE(r.degenerate);
  EXPECT_EQ(r.spacing_used, RangeSpacing::Logarithmic);
  ASSERT_EQ(r.edges.size(), 5);
  EXPECT_EQ(r.edges[0], r.min);
  EXPECT_EQ(r.edges[4], r.max);
  EXPECT_GT(r.min, 0);
  double ratio = r.edges[1] / r.edges[0];
  for (int k = 1; k < 4; ++k) {
    EXPECT_NEAR(r.edges[k + 1] / r.edges[k], ratio, 1e-12);
  }
}

// Logarithmic spacing is impossible from zero, linear spacing is used
TEST(AutoRangeTests, LogarithmicFallback) {
  Geometry geometry(1, 1, 1000, 0.172, 0.154);
  AutoRange r = auto_range(geometry, unmasked(4, 4), AbscissaKind::Q,
                           RangeSpacing::Logarithmic, 4);
  EXPECT_TRUE(r.degenerate);
  EXPECT_EQ(r.spacing_used, RangeSpacing::Linear);
  EXPECT_EQ(r.min, 0);
  ASSERT_EQ(r.edges.size(), 4);
  EXPECT_NEAR(r.edges[2] - r.edges[1], r.edges[1] - r.edges[0], 1e-12);
}

TEST(AutoRangeTests, NoValidPixels) {
  Geometry geometry(0, 0, 1000, 0.172, 0.154);
  AutoRange r = auto_range(geometry, mask_type::Zero(5, 5), AbscissaKind::Q,
                           RangeSpacing::Linear);
  EXPECT_TRUE(r.degenerate);
  EXPECT_EQ(r.edges.size(), 0);
  EXPECT_TRUE(std::isnan(r.min));
  EXPECT_TRUE(std::isnan(r.max));
}

TEST(AutoRangeTests, UnknownSpacing) {
  Geometry geometry(0, 0, 1000, 0.172, 0.154);
  EXPECT_THROW(auto_range(geometry, unmasked(4, 4), AbscissaKind::Q,
                          static_cast<RangeSpacing>(5)),
               credo::configuration_error);
}

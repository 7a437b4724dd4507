#include <cmath>
#include <credo/algorithms/integration/azimuthal_integrator.h>
#include <credo/error.h>
#include <gtest/gtest.h>

using credo::image_type;
using credo::mask_type;
using credo::unmasked;
using credo::algorithms::AzimuthalIntegrator;
using credo::model::AzimuthalCurve;
using credo::model::ErrorPropagation;
using credo::model::Geometry;
using credo::model::IntegrationSettings;

namespace {

// The intensity equals the column index
image_type column_ramp(std::size_t rows, std::size_t cols) {
  image_type image(rows, cols);
  for (std::size_t j = 0; j < rows; ++j) {
    for (std::size_t i = 0; i < cols; ++i) {
      image(j, i) = i;
    }
  }
  return image;
}

} // namespace

TEST(AzimuthalIntegratorTests, Quadrants) {
  Geometry geometry(2, 2, 1000, 0.172, 0.154);
  IntegrationSettings settings;
  settings.intensity_error_propagation = ErrorPropagation::Gaussian;
  settings.abscissa_error_propagation = ErrorPropagation::Gaussian;
  AzimuthalIntegrator integrate(geometry, settings);
  AzimuthalCurve curve = integrate(column_ramp(5, 5), unmasked(5, 5), 4);

  ASSERT_EQ(curve.size(), 4u);
  // The pixel at the beam center has no azimuth
  EXPECT_EQ(curve.tally().invalid_abscissa, 1u);
  EXPECT_EQ(curve.total_area(), 24u);
  for (int l = 0; l < 4; ++l) {
    EXPECT_EQ(curve.area()[l], 6u);
    EXPECT_GE(curve.phi()[l], l * M_PI / 2);
    EXPECT_LT(curve.phi()[l], (l + 1) * M_PI / 2);
    EXPECT_GT(curve.q_mean()[l], 0);
    EXPECT_GT(curve.q_std()[l], 0);
  }
  // Towards increasing columns, and the opposite direction
  EXPECT_DOUBLE_EQ(curve.intensity()[0], 3.5);
  EXPECT_DOUBLE_EQ(curve.intensity()[2], 0.5);
  EXPECT_EQ(curve.phi_error()[0], 0);
}

TEST(AzimuthalIntegratorTests, EmptySectors) {
  Geometry geometry(0, 0, 1000, 0.172, 0.154);
  AzimuthalIntegrator integrate(geometry, IntegrationSettings());
  // With the beam in the corner, only the first quadrant is covered
  AzimuthalCurve curve = integrate(image_type::Ones(6, 6), unmasked(6, 6), 8);
  EXPECT_EQ(curve.area()[4], 0u);
  EXPECT_TRUE(std::isnan(curve.intensity()[4]));
  EXPECT_TRUE(std::isnan(curve.q_mean()[4]));
  EXPECT_EQ(curve.total_area() + curve.tally().total(), 36u);
}

// The azimuth uncertainty follows from the beam center uncertainty
TEST(AzimuthalIntegratorTests, AzimuthUncertainty) {
  Geometry geometry(0, 0.5, 0, 0, 1000, 0, 0.172, 0, 0.154, 0);
  IntegrationSettings settings;
  settings.abscissa_error_propagation = ErrorPropagation::Average;
  AzimuthalIntegrator integrate(geometry, settings);
  mask_type mask = mask_type::Zero(1, 5);
  mask(0, 4) = 1;
  AzimuthalCurve curve = integrate(image_type::Ones(1, 5), mask, 4);
  EXPECT_EQ(curve.area()[0], 1u);
  EXPECT_EQ(curve.phi()[0], 0);
  EXPECT_DOUBLE_EQ(curve.phi_error()[0], 4 * 0.5 / 16);
}

TEST(AzimuthalIntegratorTests, ThreadCountIndependent) {
  Geometry geometry(70.4, 0.1, 55.3, 0.1, 1000, 0, 0.172, 0, 0.154, 0);
  image_type image = column_ramp(140, 110);
  IntegrationSettings settings;
  settings.nthreads = 1;
  AzimuthalCurve a = AzimuthalIntegrator(geometry, settings)(
      image, unmasked(140, 110), 36);
  settings.nthreads = 3;
  AzimuthalCurve b = AzimuthalIntegrator(geometry, settings)(
      image, unmasked(140, 110), 36);
  EXPECT_EQ(a.area(), b.area());
  for (int l = 0; l < 36; ++l) {
    EXPECT_EQ(a.intensity()[l], b.intensity()[l]);
    EXPECT_EQ(a.phi()[l], b.phi()[l]);
    EXPECT_EQ(a.q_mean()[l], b.q_mean()[l]);
  }
}

TEST(AzimuthalIntegratorTests, InvalidInput) {
  Geometry geometry(2, 2, 1000, 0.172, 0.154);
  AzimuthalIntegrator integrate(geometry, IntegrationSettings());
  EXPECT_THROW(integrate(image_type::Ones(5, 5), unmasked(5, 4), 4),
               credo::input_error);
  EXPECT_THROW(integrate(image_type::Ones(5, 5), image_type::Ones(5, 4),
                         unmasked(5, 5), 4),
               credo::input_error);
  EXPECT_THROW(integrate(image_type::Ones(5, 5), unmasked(5, 5), 0),
               credo::input_error);
}

#include <cmath>
#include <credo/algorithms/integration/error_propagation.h>
#include <credo/error.h>
#include <gtest/gtest.h>
#include <vector>

using credo::algorithms::check_error_propagation;
using credo::algorithms::ErrorPropagationAccumulator;
using credo::model::ErrorPropagation;

namespace {

void accumulate(ErrorPropagationAccumulator &acc, ErrorPropagation method,
                const std::vector<double> &values,
                const std::vector<double> &errors) {
  for (std::size_t k = 0; k < values.size(); ++k) {
    acc.add(method, values[k], errors[k]);
  }
}

} // namespace

TEST(ErrorPropagationTests, Weighted) {
  ErrorPropagationAccumulator acc;
  accumulate(acc, ErrorPropagation::Weighted, {1, 4}, {1, 2});
  double value, error;
  acc.result(ErrorPropagation::Weighted, value, error);
  EXPECT_DOUBLE_EQ(value, 1.6);
  EXPECT_DOUBLE_EQ(error, std::sqrt(1 / 1.25));
}

// Zero or non-finite uncertainties get unit weight
TEST(ErrorPropagationTests, WeightedInvalidErrors) {
  ErrorPropagationAccumulator acc;
  accumulate(acc, ErrorPropagation::Weighted, {1, 3, 5}, {0, 1, -2});
  double value, error;
  acc.result(ErrorPropagation::Weighted, value, error);
  EXPECT_DOUBLE_EQ(value, 3);
  EXPECT_DOUBLE_EQ(error, std::sqrt(1 / 3.0));
}

TEST(ErrorPropagationTests, Average) {
  ErrorPropagationAccumulator acc;
  accumulate(acc, ErrorPropagation::Average, {1, 3}, {0.5, 1.5});
  double value, error;
  acc.result(ErrorPropagation::Average, value, error);
  EXPECT_DOUBLE_EQ(value, 2);
  EXPECT_DOUBLE_EQ(error, 1);
}

TEST(ErrorPropagationTests, Gaussian) {
  ErrorPropagationAccumulator acc;
  accumulate(acc, ErrorPropagation::Gaussian, {1, 3}, {3, 4});
  double value, error;
  acc.result(ErrorPropagation::Gaussian, value, error);
  EXPECT_DOUBLE_EQ(value, 2);
  EXPECT_DOUBLE_EQ(error, 2.5);
  EXPECT_EQ(acc.count(), 2u);
}

// The larger of the standard error of the mean and the propagated error
TEST(ErrorPropagationTests, Conservative) {
  double value, error;

  ErrorPropagationAccumulator scattered;
  accumulate(scattered, ErrorPropagation::Conservative, {1, 3}, {0.1, 0.1});
  scattered.result(ErrorPropagation::Conservative, value, error);
  EXPECT_DOUBLE_EQ(value, 2);
  EXPECT_NEAR(error, 1, 1e-12);

  ErrorPropagationAccumulator uniform;
  accumulate(uniform, ErrorPropagation::Conservative, {2, 2}, {1, 1});
  uniform.result(ErrorPropagation::Conservative, value, error);
  EXPECT_DOUBLE_EQ(value, 2);
  EXPECT_DOUBLE_EQ(error, std::sqrt(2.0) / 2);

  // A single value has no spread
  ErrorPropagationAccumulator single;
  single.add(ErrorPropagation::Conservative, 5, 0.3);
  single.result(ErrorPropagation::Conservative, value, error);
  EXPECT_DOUBLE_EQ(value, 5);
  EXPECT_DOUBLE_EQ(error, 0.3);
}

TEST(ErrorPropagationTests, EmptyIsNaN) {
  ErrorPropagationAccumulator acc;
  double value, error;
  acc.result(ErrorPropagation::Gaussian, value, error);
  EXPECT_TRUE(std::isnan(value));
  EXPECT_TRUE(std::isnan(error));
  EXPECT_EQ(acc.count(), 0u);
}

// Merging partial sums gives the same result as adding everything to one
TEST(ErrorPropagationTests, Merge) {
  const ErrorPropagation methods[] = {
      ErrorPropagation::Weighted, ErrorPropagation::Average,
      ErrorPropagation::Gaussian, ErrorPropagation::Conservative};
  for (ErrorPropagation method : methods) {
    ErrorPropagationAccumulator all, first, second;
    accumulate(all, method, {1.5, 2.5, 7, 3}, {0.5, 0.25, 2, 1});
    accumulate(first, method, {1.5, 2.5}, {0.5, 0.25});
    accumulate(second, method, {7, 3}, {2, 1});
    first.merge(second);
    double v1, e1, v2, e2;
    all.result(method, v1, e1);
    first.result(method, v2, e2);
    EXPECT_DOUBLE_EQ(v1, v2) << credo::model::to_string(method);
    EXPECT_DOUBLE_EQ(e1, e2) << credo::model::to_string(method);
    EXPECT_EQ(first.count(), 4u);
  }
}

TEST(ErrorPropagationTests, UnknownMethod) {
  ErrorPropagation bad = static_cast<ErrorPropagation>(99);
  EXPECT_THROW(check_error_propagation(bad), credo::configuration_error);
  ErrorPropagationAccumulator acc;
  EXPECT_THROW(acc.add(bad, 1, 1), credo::configuration_error);
  EXPECT_EQ(acc.count(), 0u);
  EXPECT_NO_THROW(check_error_propagation(ErrorPropagation::Gaussian));
}

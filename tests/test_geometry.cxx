#include <credo/error.h>
#include <credo/model/geometry.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using credo::model::Geometry;
using json = nlohmann::json;

TEST(GeometryTests, Defaults) {
  Geometry geometry;
  EXPECT_EQ(geometry.beam_row(), 0.0);
  EXPECT_EQ(geometry.distance(), 1000.0);
  EXPECT_EQ(geometry.pixel_size(), 0.172);
  EXPECT_EQ(geometry.wavelength(), 0.15418);
  EXPECT_EQ(geometry.distance_error(), 0.0);
}

// Test that we can read a geometry from json and write it back
TEST(GeometryTests, JsonRoundTrip) {
  json data = R"(
  {
    "beam_center_row": [120.5, 0.3],
    "beam_center_col": [310.2, 0.4],
    "distance": [2500.0, 2.0],
    "pixel_size": [0.172, 0.001],
    "wavelength": [0.15418, 0.0001]
  }
  )"_json;
  Geometry geometry(data);
  EXPECT_EQ(geometry.beam_row(), 120.5);
  EXPECT_EQ(geometry.beam_row_error(), 0.3);
  EXPECT_EQ(geometry.beam_col(), 310.2);
  EXPECT_EQ(geometry.beam_col_error(), 0.4);
  EXPECT_EQ(geometry.distance(), 2500.0);
  EXPECT_EQ(geometry.distance_error(), 2.0);
  EXPECT_EQ(geometry.pixel_size_error(), 0.001);
  EXPECT_EQ(geometry.wavelength_error(), 0.0001);
  EXPECT_EQ(geometry.to_json(), data);
}

// Bare numbers have no uncertainty, missing keys keep their defaults
TEST(GeometryTests, PartialJson) {
  json data = {{"beam_center_row", 12.0}, {"beam_center_col", 13.0}};
  Geometry geometry(data);
  EXPECT_EQ(geometry.beam_row(), 12.0);
  EXPECT_EQ(geometry.beam_row_error(), 0.0);
  EXPECT_EQ(geometry.beam_col(), 13.0);
  EXPECT_EQ(geometry.distance(), 1000.0);
}

TEST(GeometryTests, MalformedJson) {
  EXPECT_THROW((void)Geometry(json::array({1, 2})), credo::input_error);
  json bad_pair = {{"distance", {1.0, 2.0, 3.0}}};
  EXPECT_THROW(Geometry{bad_pair}, credo::input_error);
  json bad_type = {{"wavelength", "Cu"}};
  EXPECT_THROW(Geometry{bad_type}, credo::input_error);
}

TEST(GeometryTests, WithBeamCenter) {
  Geometry geometry(1, 0.5, 2, 0.5, 800, 1, 0.1, 0, 0.1, 0);
  Geometry moved = geometry.with_beam_center(10, 20);
  EXPECT_EQ(moved.beam_row(), 10);
  EXPECT_EQ(moved.beam_col(), 20);
  EXPECT_EQ(moved.beam_row_error(), 0.5);
  EXPECT_EQ(moved.distance(), 800);
  EXPECT_EQ(geometry.beam_row(), 1);
}

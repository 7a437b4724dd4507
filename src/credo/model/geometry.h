#ifndef CREDO_MODEL_GEOMETRY_H
#define CREDO_MODEL_GEOMETRY_H
#include <array>
#include <cmath>
#include <credo/error.h>
#include <nlohmann/json.hpp>
#include <string>

/*
This file defines the experimental geometry of a small-angle scattering
measurement: the beam center on the detector, the sample-to-detector distance,
the pixel size and the wavelength, each with an absolute uncertainty.

Lengths (distance, pixel size) are in mm and the wavelength in nm, giving q in
1/nm. The geometry is an immutable snapshot handed over by the calibration
layer; it can be read from and written to json, where every quantity is a
two-element [value, uncertainty] array.
*/

namespace credo { namespace model {

using json = nlohmann::json;

class Geometry {
public:
  Geometry() = default;
  Geometry(double beam_row, double beam_col, double distance, double pixel_size,
           double wavelength);
  Geometry(double beam_row, double beam_row_error, double beam_col,
           double beam_col_error, double distance, double distance_error,
           double pixel_size, double pixel_size_error, double wavelength,
           double wavelength_error);
  Geometry(json geometry_data);
  json to_json() const;

  double beam_row() const { return beam_row_; }
  double beam_row_error() const { return beam_row_error_; }
  double beam_col() const { return beam_col_; }
  double beam_col_error() const { return beam_col_error_; }
  double distance() const { return distance_; }
  double distance_error() const { return distance_error_; }
  double pixel_size() const { return pixel_size_; }
  double pixel_size_error() const { return pixel_size_error_; }
  double wavelength() const { return wavelength_; }
  double wavelength_error() const { return wavelength_error_; }

  // Copies with a different beam center, used while searching for it
  Geometry with_beam_center(double beam_row, double beam_col) const;

protected:
  double beam_row_{0.0};
  double beam_row_error_{0.0};
  double beam_col_{0.0};
  double beam_col_error_{0.0};
  double distance_{1000.0};
  double distance_error_{0.0};
  double pixel_size_{0.172};
  double pixel_size_error_{0.0};
  double wavelength_{0.15418};
  double wavelength_error_{0.0};
};

namespace detail {

// Read an optional [value, uncertainty] pair (or a bare value)
inline void read_pair(const json &data, const std::string &key, double &value,
                      double &error) {
  if (data.find(key) == data.end()) {
    return;
  }
  const json &item = data[key];
  if (item.is_number()) {
    value = item.get<double>();
    error = 0.0;
  } else if (item.is_array() && item.size() == 2 && item[0].is_number() &&
             item[1].is_number()) {
    value = item[0].get<double>();
    error = item[1].get<double>();
  } else {
    throw credo::input_error("geometry item '" + key +
                             "' must be a number or [value, uncertainty]");
  }
}

} // namespace detail

inline Geometry::Geometry(double beam_row, double beam_col, double distance,
                          double pixel_size, double wavelength)
    : beam_row_{beam_row}, beam_col_{beam_col}, distance_{distance},
      pixel_size_{pixel_size}, wavelength_{wavelength} {}

inline Geometry::Geometry(double beam_row, double beam_row_error,
                          double beam_col, double beam_col_error,
                          double distance, double distance_error,
                          double pixel_size, double pixel_size_error,
                          double wavelength, double wavelength_error)
    : beam_row_{beam_row}, beam_row_error_{beam_row_error},
      beam_col_{beam_col}, beam_col_error_{beam_col_error},
      distance_{distance}, distance_error_{distance_error},
      pixel_size_{pixel_size}, pixel_size_error_{pixel_size_error},
      wavelength_{wavelength}, wavelength_error_{wavelength_error} {}

inline Geometry::Geometry(json geometry_data) {
  // Allow keys to be missing so that a partial dict falls back to defaults.
  if (!geometry_data.is_object()) {
    throw credo::input_error("geometry must be a json object");
  }
  detail::read_pair(geometry_data, "beam_center_row", beam_row_,
                    beam_row_error_);
  detail::read_pair(geometry_data, "beam_center_col", beam_col_,
                    beam_col_error_);
  detail::read_pair(geometry_data, "distance", distance_, distance_error_);
  detail::read_pair(geometry_data, "pixel_size", pixel_size_,
                    pixel_size_error_);
  detail::read_pair(geometry_data, "wavelength", wavelength_,
                    wavelength_error_);
}

inline json Geometry::to_json() const {
  json geometry_data;
  geometry_data["beam_center_row"] = {beam_row_, beam_row_error_};
  geometry_data["beam_center_col"] = {beam_col_, beam_col_error_};
  geometry_data["distance"] = {distance_, distance_error_};
  geometry_data["pixel_size"] = {pixel_size_, pixel_size_error_};
  geometry_data["wavelength"] = {wavelength_, wavelength_error_};
  return geometry_data;
}

inline Geometry Geometry::with_beam_center(double beam_row,
                                           double beam_col) const {
  Geometry result(*this);
  result.beam_row_ = beam_row;
  result.beam_col_ = beam_col;
  return result;
}

}} // namespace credo::model

#endif // CREDO_MODEL_GEOMETRY_H

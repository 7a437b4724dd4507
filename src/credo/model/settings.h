#ifndef CREDO_MODEL_SETTINGS_H
#define CREDO_MODEL_SETTINGS_H
#include <credo/error.h>
#include <credo/model/modes.h>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

/*
Settings of the pixel-to-curve reduction, as handed over by the configuration
layer of the instrument-control software.

  ierrorprop    error propagation of the intensity
  qerrorprop    error propagation of the abscissa
  abscissa      the abscissa kind of the curve
  qrangemethod  spacing of automatically determined bin edges
  qcount        number of automatic bin edges, 0 selects the default
  nthreads      number of worker threads, 0 uses the hardware concurrency
*/

namespace credo { namespace model {

using json = nlohmann::json;

class IntegrationSettings {
public:
  IntegrationSettings() = default;
  IntegrationSettings(json settings_data);
  json to_json() const;

  ErrorPropagation intensity_error_propagation{ErrorPropagation::Conservative};
  ErrorPropagation abscissa_error_propagation{ErrorPropagation::Conservative};
  AbscissaKind abscissa{AbscissaKind::Q};
  RangeSpacing range_spacing{RangeSpacing::Linear};
  std::size_t range_count{0};
  std::size_t nthreads{1};
};

namespace detail {

inline std::string read_string(const json &data, const std::string &key) {
  const json &item = data[key];
  if (!item.is_string()) {
    throw credo::input_error("setting '" + key + "' must be a string");
  }
  return item.get<std::string>();
}

inline std::size_t read_count(const json &data, const std::string &key) {
  const json &item = data[key];
  if (!item.is_number_integer() || item.get<long long>() < 0) {
    throw credo::input_error("setting '" + key +
                             "' must be a non-negative integer");
  }
  return item.get<std::size_t>();
}

} // namespace detail

inline IntegrationSettings::IntegrationSettings(json settings_data) {
  if (!settings_data.is_object()) {
    throw credo::input_error("settings must be a json object");
  }
  if (settings_data.find("ierrorprop") != settings_data.end()) {
    intensity_error_propagation = error_propagation_from_string(
        detail::read_string(settings_data, "ierrorprop"));
  }
  if (settings_data.find("qerrorprop") != settings_data.end()) {
    abscissa_error_propagation = error_propagation_from_string(
        detail::read_string(settings_data, "qerrorprop"));
  }
  if (settings_data.find("abscissa") != settings_data.end()) {
    abscissa =
        abscissa_kind_from_string(detail::read_string(settings_data, "abscissa"));
  }
  if (settings_data.find("qrangemethod") != settings_data.end()) {
    range_spacing = range_spacing_from_string(
        detail::read_string(settings_data, "qrangemethod"));
  }
  if (settings_data.find("qcount") != settings_data.end()) {
    range_count = detail::read_count(settings_data, "qcount");
  }
  if (settings_data.find("nthreads") != settings_data.end()) {
    nthreads = detail::read_count(settings_data, "nthreads");
  }
}

inline json IntegrationSettings::to_json() const {
  json settings_data;
  settings_data["ierrorprop"] = to_string(intensity_error_propagation);
  settings_data["qerrorprop"] = to_string(abscissa_error_propagation);
  settings_data["abscissa"] = to_string(abscissa);
  settings_data["qrangemethod"] = to_string(range_spacing);
  settings_data["qcount"] = range_count;
  settings_data["nthreads"] = nthreads;
  return settings_data;
}

}} // namespace credo::model

#endif // CREDO_MODEL_SETTINGS_H

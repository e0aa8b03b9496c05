/**
 * pybind11 binding for the variance-gain forecast core.
 * run(series) -> [FilterState]; forecast(series) -> (observed, estimate, error_variance).
 */

#include "forecast_errors.hpp"
#include "recursive_updater.hpp"
#include "sequence_runner.hpp"
#include "variance_estimator.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <tuple>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

forecast::FilterConfig make_config(forecast::UndefinedGainPolicy policy) {
  forecast::FilterConfig config;
  config.undefined_gain = policy;
  return config;
}

}  // namespace

PYBIND11_MODULE(forecast_core, m) {
  m.doc() = "C++ variance-gain Kalman forecaster; forecast(series) -> (observed, estimate, error_variance).";

  py::register_exception<forecast::InvalidInput>(m, "InvalidInput", PyExc_ValueError);
  py::register_exception<forecast::UndefinedGain>(m, "UndefinedGain", PyExc_ArithmeticError);

  py::enum_<forecast::UndefinedGainPolicy>(m, "UndefinedGainPolicy")
      .value("CLAMP_TO_ZERO", forecast::UndefinedGainPolicy::kClampToZero)
      .value("THROW", forecast::UndefinedGainPolicy::kThrow);

  py::class_<forecast::FilterState>(m, "FilterState")
      .def(py::init([](double observed, double estimate, double error_variance) {
             return forecast::FilterState{observed, estimate, error_variance};
           }),
           py::arg("observed"),
           py::arg("estimate"),
           py::arg("error_variance"))
      .def_property_readonly("observed", [](const forecast::FilterState& s) { return s.observed; })
      .def_property_readonly("estimate", [](const forecast::FilterState& s) { return s.estimate; })
      .def_property_readonly("error_variance",
                             [](const forecast::FilterState& s) { return s.error_variance; })
      .def("__eq__", [](const forecast::FilterState& a, const forecast::FilterState& b) { return a == b; })
      .def("__repr__", [](const forecast::FilterState& s) {
        std::ostringstream os;
        os.precision(17);
        os << "FilterState(observed=" << s.observed << ", estimate=" << s.estimate
           << ", error_variance=" << s.error_variance << ")";
        return os.str();
      });

  m.def("sample_variance", &forecast::sample_variance,
        py::arg("values"),
        "Population variance of the series (divisor n); 0 for a single element.");

  m.def(
      "kalman_gain",
      [](double predicted_variance, double noise, forecast::UndefinedGainPolicy policy) {
        return forecast::kalman_gain(predicted_variance, noise, make_config(policy));
      },
      py::arg("predicted_variance"),
      py::arg("noise"),
      py::arg("policy") = forecast::UndefinedGainPolicy::kClampToZero,
      "Gain p_pred / (noise + p_pred); a zero denominator is resolved by policy.");

  m.def("initial_state", &forecast::initial_state,
        py::arg("first"),
        py::arg("noise"));

  m.def(
      "update",
      [](const forecast::FilterState& state, double noise, double observation,
         forecast::UndefinedGainPolicy policy) {
        return forecast::update_state(state, noise, observation, make_config(policy));
      },
      py::arg("state"),
      py::arg("noise"),
      py::arg("observation"),
      py::arg("policy") = forecast::UndefinedGainPolicy::kClampToZero,
      "One predict/correct step: returns the next FilterState.");

  m.def(
      "run",
      [](const std::vector<double>& series, forecast::UndefinedGainPolicy policy) {
        return forecast::run_filter(series, make_config(policy));
      },
      py::arg("series"),
      py::arg("policy") = forecast::UndefinedGainPolicy::kClampToZero,
      "Filter the whole series: one FilterState per element, in input order.");

  m.def(
      "forecast",
      [](const std::vector<double>& series, forecast::UndefinedGainPolicy policy) {
        forecast::ForecastColumns cols = forecast::forecast_series(series, make_config(policy));
        return std::make_tuple(std::move(cols.observed), std::move(cols.estimate),
                               std::move(cols.error_variance));
      },
      py::arg("series"),
      py::arg("policy") = forecast::UndefinedGainPolicy::kClampToZero,
      "Returns (observed, estimate, error_variance) lists aligned by index.");
}

/**
 * Sequential fold of update_state over a series.
 */

#include "sequence_runner.hpp"

#include "forecast_errors.hpp"
#include "recursive_updater.hpp"
#include "variance_estimator.hpp"

namespace forecast {

FilterState initial_state(double first, double noise) {
  return FilterState{first, first, noise};
}

std::vector<FilterState> run_filter(const std::vector<double>& series,
                                    const FilterConfig& config) {
  if (series.empty()) {
    throw InvalidInput("run_filter: series must not be empty");
  }
  const double noise = sample_variance(series);

  std::vector<FilterState> out;
  out.reserve(series.size());
  out.push_back(initial_state(series.front(), noise));
  for (size_t i = 1; i < series.size(); ++i) {
    out.push_back(update_state(out.back(), noise, series[i], config));
  }
  return out;
}

ForecastColumns forecast_series(const std::vector<double>& series,
                                const FilterConfig& config) {
  const std::vector<FilterState> states = run_filter(series, config);
  ForecastColumns cols;
  cols.observed.reserve(states.size());
  cols.estimate.reserve(states.size());
  cols.error_variance.reserve(states.size());
  for (const auto& s : states) {
    cols.observed.push_back(s.observed);
    cols.estimate.push_back(s.estimate);
    cols.error_variance.push_back(s.error_variance);
  }
  return cols;
}

}  // namespace forecast

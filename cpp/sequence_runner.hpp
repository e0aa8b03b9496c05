/**
 * Runs the variance-gain filter over a whole series.
 *
 * noise = sample_variance(series) is computed once; the initial state is taken
 * from series[0] and update_state is folded over the rest, left to right.
 * Output has one state per input element, in input order.
 */

#ifndef FORECAST_CPP_SEQUENCE_RUNNER_HPP_
#define FORECAST_CPP_SEQUENCE_RUNNER_HPP_

#include "filter_config.hpp"
#include "filter_state.hpp"

#include <vector>

namespace forecast {

/** Columnar view of a run, for plotting price against forecast by index. */
struct ForecastColumns {
  std::vector<double> observed;
  std::vector<double> estimate;
  std::vector<double> error_variance;
};

/** observed = estimate = first, error_variance = noise. */
FilterState initial_state(double first, double noise);

/** Throws InvalidInput on an empty or non-finite series. */
std::vector<FilterState> run_filter(const std::vector<double>& series,
                                    const FilterConfig& config = {});

ForecastColumns forecast_series(const std::vector<double>& series,
                                const FilterConfig& config = {});

}  // namespace forecast

#endif  // FORECAST_CPP_SEQUENCE_RUNNER_HPP_

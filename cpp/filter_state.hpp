/**
 * Per-step state of the variance-gain filter.
 *
 * A state is produced once (initial state or one update) and never modified
 * afterwards; the next step builds a fresh value from it.
 */

#ifndef FORECAST_CPP_FILTER_STATE_HPP_
#define FORECAST_CPP_FILTER_STATE_HPP_

namespace forecast {

struct FilterState {
  double observed;        // last ingested observation
  double estimate;        // smoothed value, forecast for the next index
  double error_variance;  // >= 0
};

inline bool operator==(const FilterState& a, const FilterState& b) {
  return a.observed == b.observed && a.estimate == b.estimate &&
         a.error_variance == b.error_variance;
}

inline bool operator!=(const FilterState& a, const FilterState& b) { return !(a == b); }

}  // namespace forecast

#endif  // FORECAST_CPP_FILTER_STATE_HPP_

/**
 * Run-time options for the variance-gain filter.
 *
 * The noise parameter itself is not configurable: it is always the population
 * variance of the series being filtered, used as both Q and R.
 */

#ifndef FORECAST_CPP_FILTER_CONFIG_HPP_
#define FORECAST_CPP_FILTER_CONFIG_HPP_

namespace forecast {

/** What to do when the gain denominator R + p_pred is zero (constant series). */
enum class UndefinedGainPolicy {
  kClampToZero,  // k = 0: estimate held, error variance stays 0
  kThrow,        // raise UndefinedGain
};

struct FilterConfig {
  UndefinedGainPolicy undefined_gain = UndefinedGainPolicy::kClampToZero;
};

}  // namespace forecast

#endif  // FORECAST_CPP_FILTER_CONFIG_HPP_

/**
 * One predict/correct cycle of the scalar variance-gain Kalman filter.
 *
 * State-space: x = level (scalar). F=1, H=1, Q=R=noise, where noise is the
 * population variance of the series. The same value feeds predict and gain.
 */

#ifndef FORECAST_CPP_RECURSIVE_UPDATER_HPP_
#define FORECAST_CPP_RECURSIVE_UPDATER_HPP_

#include "filter_config.hpp"
#include "filter_state.hpp"

namespace forecast {

/** p_pred = p + noise. */
double predict_variance(double error_variance, double noise);

/**
 * k = p_pred / (noise + p_pred). In [0, 1) whenever noise > 0.
 * A zero denominator is resolved by config.undefined_gain: 0.0 or UndefinedGain.
 * A denominator that overflows throws InvalidInput.
 */
double kalman_gain(double predicted_variance, double noise, const FilterConfig& config = {});

/** Fold observation y into state. Returns the next state; state is untouched. */
FilterState update_state(const FilterState& state, double noise, double observation,
                         const FilterConfig& config = {});

}  // namespace forecast

#endif  // FORECAST_CPP_RECURSIVE_UPDATER_HPP_

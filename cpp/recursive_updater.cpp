/**
 * Scalar predict/correct with Q pinned to R.
 */

#include "recursive_updater.hpp"

#include "forecast_errors.hpp"

#include <cmath>

namespace forecast {

double predict_variance(double error_variance, double noise) {
  return error_variance + noise;
}

double kalman_gain(double predicted_variance, double noise, const FilterConfig& config) {
  const double S = noise + predicted_variance;
  if (!std::isfinite(S)) {
    throw InvalidInput("kalman_gain: noise + predicted variance is not finite");
  }
  if (S > 0.0) {
    return predicted_variance / S;
  }
  if (config.undefined_gain == UndefinedGainPolicy::kThrow) {
    throw UndefinedGain("kalman_gain: noise + predicted variance is zero");
  }
  return 0.0;
}

FilterState update_state(const FilterState& state, double noise, double observation,
                         const FilterConfig& config) {
  const double P_pred = predict_variance(state.error_variance, noise);
  const double K = kalman_gain(P_pred, noise, config);
  // estimate + K * (y - estimate), as a convex blend so finite inputs stay finite
  const double x = (1.0 - K) * state.estimate + K * observation;
  const double P_new = (1.0 - K) * P_pred;
  return FilterState{observation, x, (P_new < 0.0) ? 0.0 : P_new};
}

}  // namespace forecast

/**
 * Noise parameter for the variance-gain filter: population variance of the
 * whole series (divisor n), computed once before the recursion starts.
 */

#ifndef FORECAST_CPP_VARIANCE_ESTIMATOR_HPP_
#define FORECAST_CPP_VARIANCE_ESTIMATOR_HPP_

#include <vector>

namespace forecast {

/**
 * Mean of squared deviations from the mean. A single element gives 0.
 * Throws InvalidInput on an empty series or a non-finite element.
 */
double sample_variance(const std::vector<double>& values);

}  // namespace forecast

#endif  // FORECAST_CPP_VARIANCE_ESTIMATOR_HPP_

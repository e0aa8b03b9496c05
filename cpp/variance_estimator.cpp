/**
 * Population variance, two-pass.
 */

#include "variance_estimator.hpp"

#include "forecast_errors.hpp"

#include <cmath>
#include <string>

namespace forecast {

double sample_variance(const std::vector<double>& values) {
  if (values.empty()) {
    throw InvalidInput("sample_variance: series must not be empty");
  }
  for (size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      throw InvalidInput("sample_variance: non-finite value at index " + std::to_string(i));
    }
  }
  if (values.size() == 1) {
    return 0.0;
  }

  // Running mean; v / k - mean / k stays finite for any finite v and mean.
  double mean = 0.0;
  double k = 0.0;
  for (double v : values) {
    k += 1.0;
    mean += v / k - mean / k;
  }

  double sq = 0.0;
  for (double v : values) {
    const double d = v - mean;
    sq += d * d;
  }
  const double var = sq / static_cast<double>(values.size());
  if (!std::isfinite(var)) {
    throw InvalidInput("sample_variance: variance overflows double range");
  }
  return var;
}

}  // namespace forecast

/**
 * Exception types raised by the forecast core.
 * The pybind11 module registers both so Python callers can catch them by name.
 */

#ifndef FORECAST_CPP_FORECAST_ERRORS_HPP_
#define FORECAST_CPP_FORECAST_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace forecast {

/** Empty series or non-finite observation; no initial state can be formed. */
class InvalidInput : public std::invalid_argument {
 public:
  explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

/** R + p_pred == 0 under UndefinedGainPolicy::kThrow. */
class UndefinedGain : public std::domain_error {
 public:
  explicit UndefinedGain(const std::string& what) : std::domain_error(what) {}
};

}  // namespace forecast

#endif  // FORECAST_CPP_FORECAST_ERRORS_HPP_

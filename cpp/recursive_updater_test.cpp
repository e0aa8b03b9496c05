/**
 * Unit tests for one predict/correct step.
 */

#include "forecast_errors.hpp"
#include "recursive_updater.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

namespace {

constexpr double kTol = 1e-12;
constexpr double kR = 0.6875;

forecast::FilterConfig throwing_config() {
  forecast::FilterConfig config;
  config.undefined_gain = forecast::UndefinedGainPolicy::kThrow;
  return config;
}

TEST(RecursiveUpdaterTest, PredictAddsNoiseOnce) {
  EXPECT_DOUBLE_EQ(forecast::predict_variance(kR, kR), 1.375);
  EXPECT_DOUBLE_EQ(forecast::predict_variance(0.0, kR), kR);
}

TEST(RecursiveUpdaterTest, GainUsesPredictedVarianceInDenominator) {
  EXPECT_NEAR(forecast::kalman_gain(1.375, kR), 2.0 / 3.0, kTol);
}

TEST(RecursiveUpdaterTest, GainInUnitIntervalForPositiveNoise) {
  for (double p : {0.0, 1e-9, 0.5, 1.0, 10.0, 1e9}) {
    const double k = forecast::kalman_gain(forecast::predict_variance(p, kR), kR);
    EXPECT_GE(k, 0.0) << "p " << p;
    EXPECT_LT(k, 1.0) << "p " << p;
  }
}

TEST(RecursiveUpdaterTest, ZeroDenominatorClampsToZeroByDefault) {
  EXPECT_EQ(forecast::kalman_gain(0.0, 0.0), 0.0);
}

TEST(RecursiveUpdaterTest, ZeroDenominatorThrowsWhenAsked) {
  EXPECT_THROW(forecast::kalman_gain(0.0, 0.0, throwing_config()),
               forecast::UndefinedGain);
}

TEST(RecursiveUpdaterTest, OverflowingDenominatorThrowsInvalidInput) {
  const double big = std::numeric_limits<double>::max();
  EXPECT_THROW(forecast::kalman_gain(big, big), forecast::InvalidInput);
  EXPECT_THROW(forecast::kalman_gain(big, big, throwing_config()), forecast::InvalidInput);
  const forecast::FilterState s0{0.0, 0.0, big};
  EXPECT_THROW(forecast::update_state(s0, big, 1.0), forecast::InvalidInput);
}

TEST(RecursiveUpdaterTest, WideInnovationStaysFinite) {
  const double big = std::numeric_limits<double>::max();
  const forecast::FilterState s0{-big, -big, 1.0};
  const forecast::FilterState s1 = forecast::update_state(s0, 1.0, big);
  EXPECT_TRUE(std::isfinite(s1.estimate));
  EXPECT_GT(s1.estimate, -big);
  EXPECT_LT(s1.estimate, big);
}

TEST(RecursiveUpdaterTest, FirstStepOfReferenceScenario) {
  const forecast::FilterState s0{10.0, 10.0, kR};
  const forecast::FilterState s1 = forecast::update_state(s0, kR, 11.0);
  EXPECT_DOUBLE_EQ(s1.observed, 11.0);
  EXPECT_NEAR(s1.estimate, 10.0 + 2.0 / 3.0, kTol);
  EXPECT_NEAR(s1.error_variance, 1.375 / 3.0, kTol);
  // input state is left as it was
  EXPECT_DOUBLE_EQ(s0.estimate, 10.0);
  EXPECT_DOUBLE_EQ(s0.error_variance, kR);
}

TEST(RecursiveUpdaterTest, ConstantSeriesHoldsEstimateUnderClamp) {
  const forecast::FilterState s0{5.0, 5.0, 0.0};
  const forecast::FilterState s1 = forecast::update_state(s0, 0.0, 5.0);
  EXPECT_EQ(s1, (forecast::FilterState{5.0, 5.0, 0.0}));
}

TEST(RecursiveUpdaterTest, ConstantSeriesThrowsUnderThrowPolicy) {
  const forecast::FilterState s0{5.0, 5.0, 0.0};
  EXPECT_THROW(forecast::update_state(s0, 0.0, 5.0, throwing_config()),
               forecast::UndefinedGain);
}

TEST(RecursiveUpdaterTest, PosteriorVarianceNeverExceedsPredicted) {
  forecast::FilterState s{0.0, 0.0, 3.0};
  for (double y : {1.0, -2.0, 0.5, 7.0, -7.0}) {
    const double p_pred = forecast::predict_variance(s.error_variance, 2.0);
    s = forecast::update_state(s, 2.0, y);
    EXPECT_LE(s.error_variance, p_pred);
    EXPECT_GE(s.error_variance, 0.0);
  }
}

}  // namespace

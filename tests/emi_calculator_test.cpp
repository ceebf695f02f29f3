// =============================================================================
// emi_calculator_test.cpp
// =============================================================================
// Unit tests for lendflow::computeEmi() and lendflow::maxPrincipalForEmi().
//
// Validates:
//   - Reference values of the annuity formula at 2-decimal rounding
//   - Zero-rate degenerate case
//   - Monotonicity in the rate, idempotence
//   - maxPrincipalForEmi() inverts computeEmi() to the rupee
//   - Argument validation
// =============================================================================

#include "lendflow/underwriting/emi_calculator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

// -----------------------------------------------------------------------------
// 1. Known reference values.
// Why: Every customer-facing EMI comes from this function; the values are
//      checked against an independent calculation of the same formula.
// -----------------------------------------------------------------------------
TEST(EmiCalculatorTest, MatchesReferenceValues) {
  EXPECT_NEAR(lendflow::computeEmi(300000.0, 12.5, 36), 10036.09, 0.005);
  EXPECT_NEAR(lendflow::computeEmi(500000.0, 13.5, 24), 23888.51, 0.005);
  EXPECT_NEAR(lendflow::computeEmi(100000.0, 12.0, 12), 8884.88, 0.005);
  EXPECT_NEAR(lendflow::computeEmi(400000.0, 12.0, 24), 18829.39, 0.005);
}

// -----------------------------------------------------------------------------
// 2. A zero rate repays the principal in equal parts.
// -----------------------------------------------------------------------------
TEST(EmiCalculatorTest, ZeroRateIsStraightLine) {
  EXPECT_DOUBLE_EQ(lendflow::computeEmi(120000.0, 0.0, 12), 10000.0);
  EXPECT_DOUBLE_EQ(lendflow::maxPrincipalForEmi(20000.0, 0.0, 24), 480000.0);
}

// -----------------------------------------------------------------------------
// 3. For fixed principal and tenure, EMI never falls as the rate rises.
// -----------------------------------------------------------------------------
TEST(EmiCalculatorTest, NonDecreasingInRate) {
  double previous = 0.0;
  for (int tenths = 0; tenths <= 300; tenths += 5) {
    const double emi = lendflow::computeEmi(250000.0, tenths / 10.0, 48);
    EXPECT_GE(emi, previous) << "rate=" << tenths / 10.0;
    previous = emi;
  }
}

// -----------------------------------------------------------------------------
// 4. Same inputs, same output: no hidden state.
// -----------------------------------------------------------------------------
TEST(EmiCalculatorTest, IdempotentForIdenticalInputs) {
  const double first = lendflow::computeEmi(437500.0, 11.75, 42);
  const double second = lendflow::computeEmi(437500.0, 11.75, 42);
  EXPECT_EQ(first, second);
}

// -----------------------------------------------------------------------------
// 5. The affordable principal at a given EMI cap.
// Why: This is the "suggested amount" shown after an affordability
//      rejection; its EMI must not exceed the cap by more than rounding.
// -----------------------------------------------------------------------------
TEST(EmiCalculatorTest, MaxPrincipalRespectsEmiCap) {
  const double principal = lendflow::maxPrincipalForEmi(20000.0, 13.5, 24);
  EXPECT_DOUBLE_EQ(principal, 418611.0);
  EXPECT_LE(lendflow::computeEmi(principal, 13.5, 24), 20000.01);
}

// -----------------------------------------------------------------------------
// 6. Invalid arguments throw std::invalid_argument.
// -----------------------------------------------------------------------------
TEST(EmiCalculatorTest, RejectsInvalidArguments) {
  EXPECT_THROW(lendflow::computeEmi(0.0, 12.0, 12), std::invalid_argument);
  EXPECT_THROW(lendflow::computeEmi(-5.0, 12.0, 12), std::invalid_argument);
  EXPECT_THROW(lendflow::computeEmi(1000.0, 12.0, 0), std::invalid_argument);
  EXPECT_THROW(lendflow::computeEmi(1000.0, -1.0, 12), std::invalid_argument);
  EXPECT_THROW(lendflow::maxPrincipalForEmi(1000.0, 12.0, 0),
               std::invalid_argument);
}

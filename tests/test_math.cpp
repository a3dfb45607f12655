#include <gtest/gtest.h>
#include "setOptions.hpp"
#include "mathStats.hpp"
#include <cmath>
#include <limits>
#include <vector>
#include "test_util.h"
using namespace std;

const double NA = numeric_limits<double>::quiet_NaN();

TEST(MathTest, NormalTails) {
  ASSERT_NEAR(qnorm(0.025, true), 1.959963984540054, 1e-9);
  ASSERT_NEAR(qnorm(0.975), 1.959963984540054, 1e-9);
  ASSERT_NEAR(pnorm(0.0), 0.5, 1e-12);
  ASSERT_NEAR(pnorm(1.959963984540054, true), 0.025, 1e-12);
}

TEST(MathTest, TwoSidedPval) {
  ASSERT_NEAR(two_sided_pval(1.959963984540054), 0.05, 1e-12);
  ASSERT_NEAR(two_sided_pval(-1.959963984540054), 0.05, 1e-12);
  ASSERT_DOUBLE_EQ(two_sided_pval(0.0), 1.0);
  ASSERT_TRUE(std::isnan(two_sided_pval(NA)));
  // far tail stays positive instead of rounding to zero
  ASSERT_GT(two_sided_pval(30.0), 0.0);
}

TEST(MathTest, SignedZFromPval) {
  ASSERT_NEAR(signed_z_from_pval(0.05, 2.0), 1.959963984540054, 1e-9);
  ASSERT_NEAR(signed_z_from_pval(0.05, -0.1), -1.959963984540054, 1e-9);
  // p = 0 is clamped rather than giving an infinite z
  ASSERT_TRUE(std::isfinite(signed_z_from_pval(0.0, 1.0)));
}

TEST(MathTest, FisherRoundTrip) {
  for (double r : {-0.95, -0.3, 0.0, 0.42, 0.999}) {
    ASSERT_NEAR(fisher_z_inv(fisher_z(r)), r, 1e-12);
  }
  ASSERT_DOUBLE_EQ(fisher_z_se(103), 0.1);
}

TEST(StoufferTest, EqualWeights) {
  stouffer_result st = stouffer({0.05, 0.05}, {1.0, 1.0}, {}, stouffer_weight_mode::equal, missing_n_mode::equal_all);
  ASSERT_NEAR(st.Z, 2.771807648699355, 1e-9);
  ASSERT_NEAR(st.pval, 0.005574596680784527, 1e-9);
  ASSERT_EQ(st.n_used, 2);
  ASSERT_TRUE(st.equal_weights);
}

TEST(StoufferTest, SqrtNWeights) {
  stouffer_result st = stouffer({0.01, 0.2}, {1.0, -1.0}, {100, 25}, stouffer_weight_mode::sqrt_n, missing_n_mode::equal_all);
  ASSERT_NEAR(st.Z, 1.7307644850227113, 1e-9);
  ASSERT_NEAR(st.pval, 0.08349377861741036, 1e-9);
  ASSERT_FALSE(st.equal_weights);
}

TEST(StoufferTest, MissingNPolicies) {
  vector<double> p = {0.01, 0.2};
  vector<double> e = {1.0, -1.0};
  vector<double> n = {100, NA};

  stouffer_result eq = stouffer(p, e, n, stouffer_weight_mode::sqrt_n, missing_n_mode::equal_all);
  ASSERT_TRUE(eq.equal_weights);
  ASSERT_NEAR(eq.Z, 0.9151925652816255, 1e-9);

  stouffer_result unit = stouffer(p, e, n, stouffer_weight_mode::sqrt_n, missing_n_mode::unit);
  ASSERT_FALSE(unit.equal_weights);
  ASSERT_NEAR(unit.Z, 2.4355268057749795, 1e-9);
  ASSERT_NEAR(unit.pval, 0.014870122780267003, 1e-9);
}

TEST(StoufferTest, GlobalOptionsSelectWeighting) {
  global_opts::reset();
  global_opts::set_stouffer_options("sqrt_n", "unit");
  stouffer_result st = stouffer({0.01, 0.2}, {1.0, -1.0}, {100, NA});
  ASSERT_NEAR(st.Z, 2.4355268057749795, 1e-9);
  global_opts::reset();
}

TEST(StoufferTest, SkipsMissingPvals) {
  stouffer_result st = stouffer({0.05, NA, 0.05}, {1.0, 1.0, 1.0}, {}, stouffer_weight_mode::equal, missing_n_mode::equal_all);
  ASSERT_EQ(st.n_used, 2);
  ASSERT_NEAR(st.Z, 2.771807648699355, 1e-9);

  stouffer_result none = stouffer({NA}, {1.0}, {}, stouffer_weight_mode::equal, missing_n_mode::equal_all);
  ASSERT_EQ(none.n_used, 0);
  ASSERT_TRUE(std::isnan(none.pval));
}

TEST(StoufferTest, LengthMismatchThrows) {
  ASSERT_THROW(stouffer({0.1, 0.2}, {1.0}, {}, stouffer_weight_mode::equal, missing_n_mode::equal_all), std::invalid_argument);
}

TEST(MultipleTestingTest, BenjaminiHochberg) {
  vector<double> q = p_adjust_bh({0.01, 0.04, 0.03, 0.005});
  ASSERT_NEAR(q[0], 0.02, 1e-12);
  ASSERT_NEAR(q[1], 0.04, 1e-12);
  ASSERT_NEAR(q[2], 0.04, 1e-12);
  ASSERT_NEAR(q[3], 0.02, 1e-12);
}

TEST(MultipleTestingTest, BenjaminiHochbergNaNAndCap) {
  vector<double> q = p_adjust_bh({0.9, NA, 0.8});
  ASSERT_NEAR(q[0], 0.9, 1e-12);
  ASSERT_TRUE(std::isnan(q[1]));
  ASSERT_NEAR(q[2], 0.9, 1e-12);

  ASSERT_EQ(p_adjust_bh({}).size(), 0u);
}

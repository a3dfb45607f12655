#include <gtest/gtest.h>
#include "setOptions.hpp"
#include "suffStats.hpp"
#include "metaAnalysis.hpp"
#include <cmath>
#include <string>
#include <vector>
#include "test_util.h"
using namespace std;

static stat_key test_key(const string &metric = "logFC") {
  stat_key k;
  k.pair_key = 1;
  k.disease_key = 1;
  k.technology = "RNA-SEQ";
  k.metric_name = metric;
  return k;
}

static suff_stat effect_row(const vector<double> &theta, const vector<double> &se) {
  suff_stat ss(test_key(), metric_kind::effect);
  for (size_t i = 0; i < theta.size(); i++) {
    ss.fold(100 + i, theta[i], se[i], numeric_limits<double>::quiet_NaN());
  }
  return ss;
}

TEST(MetaTest, DerSimonianLairdFixture) {
  suff_stat ss = effect_row({0.2, 0.5, 0.3}, {0.1, 0.2, 0.15});
  optional<dsl_result> d = dsl_pool(ss);
  ASSERT_TRUE(d.has_value());

  ASSERT_EQ(d->k, 3);
  ASSERT_NEAR(d->theta_fixed, 0.27049180327868855, 1e-6);
  ASSERT_NEAR(d->Q, 1.8524590163934445, 1e-6);
  ASSERT_NEAR(d->tau2, 0.0, 1e-12);
  ASSERT_NEAR(d->theta, 0.27049180327868855, 1e-6);
  ASSERT_NEAR(d->se, 0.07682212795973759, 1e-6);
  ASSERT_NEAR(d->I2, 0.0, 1e-12);
  ASSERT_NEAR(d->z, 3.5210141981546395, 1e-6);
  ASSERT_NEAR(d->pval, 0.0004298995973944602, 1e-6);
}

TEST(MetaTest, DerSimonianLairdHeterogeneous) {
  suff_stat ss = effect_row({0.1, 0.9, 0.4}, {0.1, 0.1, 0.1});
  optional<dsl_result> d = dsl_pool(ss);
  ASSERT_TRUE(d.has_value());

  ASSERT_NEAR(d->Q, 32.666666666666664, 1e-6);
  ASSERT_NEAR(d->tau2, 0.15333333333333332, 1e-6);
  ASSERT_NEAR(d->theta, 0.4666666666666667, 1e-6);
  ASSERT_NEAR(d->se, 0.23333333333333334, 1e-6);
  ASSERT_NEAR(d->I2, 93.87755102040816, 1e-6);
}

TEST(MetaTest, SingleStudyBoundary) {
  suff_stat ss = effect_row({0.25}, {0.05});
  optional<dsl_result> d = dsl_pool(ss);
  ASSERT_TRUE(d.has_value());

  ASSERT_EQ(d->k, 1);
  ASSERT_DOUBLE_EQ(d->tau2, 0.0);
  ASSERT_DOUBLE_EQ(d->Q, 0.0);
  ASSERT_TRUE(std::isnan(d->I2));
  ASSERT_NEAR(d->theta, 0.25, 1e-12);
  ASSERT_NEAR(d->se, 0.05, 1e-12);
}

TEST(MetaTest, NoStudiesNoResult) {
  suff_stat ss(test_key(), metric_kind::effect);
  ASSERT_FALSE(dsl_pool(ss).has_value());
  ASSERT_FALSE(pool_metric(ss, "FR_x", "t").has_value());
}

TEST(MetaTest, PooledEffectRow) {
  suff_stat ss = effect_row({0.2, 0.5, 0.3}, {0.1, 0.2, 0.15});
  optional<pooled_result> p = pool_metric(ss, "FR_1", "2020-01-01T00:00:00Z", 0.95);
  ASSERT_TRUE(p.has_value());

  ASSERT_TRUE(p->key == test_key());
  ASSERT_EQ(p->included_study_count, 3);
  ASSERT_NEAR(p->theta_pooled, 0.27049180327868855, 1e-9);
  ASSERT_NEAR(p->ci_lower, 0.11992319926187539, 1e-9);
  ASSERT_NEAR(p->ci_upper, 0.4210604072955017, 1e-9);
  ASSERT_DOUBLE_EQ(p->sign_consistency, 1.0);
  ASSERT_DOUBLE_EQ(p->n_total, 0.0);
  ASSERT_EQ(p->feature_run_id, "FR_1");
}

TEST(MetaTest, CorrelationBackTransform) {
  suff_stat ss(test_key("pearson"), metric_kind::correlation);
  ss.fold(1, fisher_z(0.3), fisher_z_se(50), 50);
  ss.fold(2, fisher_z(0.5), fisher_z_se(100), 100);

  optional<pooled_result> p = pool_metric(ss, "FR_1", "t", 0.95);
  ASSERT_TRUE(p.has_value());

  ASSERT_NEAR(p->theta_fixed, 0.4710424819302053, 1e-9);
  ASSERT_NEAR(p->tau2, 0.012955855366386049, 1e-9);
  ASSERT_NEAR(p->se_pooled, 0.11769200823161095, 1e-9);
  ASSERT_NEAR(p->theta_pooled, 0.423772834047974, 1e-9);
  ASSERT_NEAR(p->ci_lower, 0.2180517577831363, 1e-9);
  ASSERT_NEAR(p->ci_upper, 0.5934363781406172, 1e-9);
  ASSERT_NEAR(p->I2, 45.06573764845845, 1e-6);
  ASSERT_DOUBLE_EQ(p->n_total, 150.0);
}

TEST(MetaTest, CorrelationSingleStudyRoundTrip) {
  suff_stat ss(test_key("pearson"), metric_kind::correlation);
  ss.fold(1, fisher_z(-0.62), fisher_z_se(40), 40);
  optional<pooled_result> p = pool_metric(ss, "FR_1", "t", 0.95);
  ASSERT_TRUE(p.has_value());
  ASSERT_NEAR(p->theta_pooled, -0.62, 1e-12);
  ASSERT_LT(p->ci_lower, -0.62);
  ASSERT_GT(p->ci_upper, -0.62);
  ASSERT_GT(p->ci_lower, -1.0);
}

TEST(MetaTest, SignConsistency) {
  suff_stat ss = effect_row({0.4, 0.3, -0.1, 0.2}, {0.1, 0.1, 0.1, 0.1});
  optional<pooled_result> p = pool_metric(ss, "FR_1", "t", 0.95);
  ASSERT_TRUE(p.has_value());
  ASSERT_DOUBLE_EQ(p->sign_consistency, 0.75);
}

TEST(SuffStatTest, FoldOutcomes) {
  suff_stat ss(test_key(), metric_kind::effect);
  ASSERT_EQ(ss.fold(7, 0.2, 0.1, 30), fold_outcome::added);
  suff_stat before = ss;

  ASSERT_EQ(ss.fold(7, 0.2, 0.1, 30), fold_outcome::unchanged);
  ASSERT_EQ(ss.S1, before.S1);
  ASSERT_EQ(ss.St, before.St);
  ASSERT_EQ(ss.St2, before.St2);
  ASSERT_EQ(ss.k, 1);

  ASSERT_EQ(ss.fold(7, 0.3, 0.1, 30), fold_outcome::replaced);
  ASSERT_EQ(ss.k, 1);
  ASSERT_NEAR(ss.St, 30.0, 1e-9);
  ASSERT_TRUE(ss.consistent());
}

TEST(SuffStatTest, UnfoldLastStudyZeroesSums) {
  suff_stat ss(test_key(), metric_kind::effect);
  ss.fold(1, 0.123, 0.07, 10);
  ASSERT_TRUE(ss.unfold(1));
  ASSERT_FALSE(ss.unfold(1));
  ASSERT_EQ(ss.k, 0);
  ASSERT_EQ(ss.S1, 0.0);
  ASSERT_EQ(ss.St2, 0.0);
  ASSERT_TRUE(ss.empty());
}

TEST(SuffStatTest, FoldRejectsBadStandardError) {
  suff_stat ss(test_key(), metric_kind::effect);
  ASSERT_THROW(ss.fold(1, 0.1, 0.0, 10), std::invalid_argument);
  ASSERT_THROW(ss.fold(1, 0.1, -1.0, 10), std::invalid_argument);
  ASSERT_EQ(ss.k, 0);
}

TEST(SuffStatTest, ConsistencyDetectsDrift) {
  suff_stat ss = effect_row({0.2, 0.5, 0.3}, {0.1, 0.2, 0.15});
  ASSERT_TRUE(ss.consistent(1e-9));
  ss.S1 *= 1.001;
  ASSERT_FALSE(ss.consistent(1e-9));
}

TEST(SuffStatTest, PrepareContribution) {
  contribution c;
  string code, details;

  ASSERT_TRUE(prepare_contribution(effect_component(1, "1_2", "m", 0.5, 0.2), 4, c, code, details));
  ASSERT_DOUBLE_EQ(c.theta, 0.5);
  ASSERT_DOUBLE_EQ(c.se, 0.2);

  ASSERT_FALSE(prepare_contribution(effect_component(1, "1_2", "m", 0.5, 0.0), 4, c, code, details));
  ASSERT_EQ(code, err_code::NON_POSITIVE_SE);

  ASSERT_FALSE(prepare_contribution(effect_component(1, "1_2", "m", numeric_limits<double>::quiet_NaN(), 0.1), 4, c, code, details));
  ASSERT_EQ(code, err_code::NON_FINITE_ESTIMATE);

  ASSERT_TRUE(prepare_contribution(correlation_component(1, "1_2", "r", 0.3, 28), 4, c, code, details));
  ASSERT_NEAR(c.theta, std::atanh(0.3), 1e-15);
  ASSERT_NEAR(c.se, 0.2, 1e-15);

  ASSERT_FALSE(prepare_contribution(correlation_component(1, "1_2", "r", 0.3, 3), 4, c, code, details));
  ASSERT_EQ(code, err_code::CORRELATION_N_TOO_SMALL);

  // the configured minimum applies above the floor of 4
  ASSERT_FALSE(prepare_contribution(correlation_component(1, "1_2", "r", 0.3, 8), 10, c, code, details));
  ASSERT_EQ(code, err_code::CORRELATION_N_TOO_SMALL);

  ASSERT_FALSE(prepare_contribution(correlation_component(1, "1_2", "r", 1.0, 50), 4, c, code, details));
  ASSERT_EQ(code, err_code::CORRELATION_OUT_OF_RANGE);
}

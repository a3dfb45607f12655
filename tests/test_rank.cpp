#include <gtest/gtest.h>
#include "setOptions.hpp"
#include "statStore.hpp"
#include "aggregator.hpp"
#include "rankView.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "test_util.h"
using namespace std;

static pooled_result pooled_row(long pair_key, const string &metric, double pval, double theta, double I2, int k, double n,
                                double cons, const string &run, const string &ts) {
  pooled_result r;
  r.key.pair_key = pair_key;
  r.key.disease_key = 1;
  r.key.technology = "RNA-SEQ";
  r.key.metric_name = metric;
  r.kind = metric_kind::effect;
  r.theta_pooled = theta;
  r.ci_lower = theta - 0.1;
  r.ci_upper = theta + 0.1;
  r.theta_fixed = theta;
  r.se_pooled = 0.05;
  r.z = theta / 0.05;
  r.pval = pval;
  r.tau2 = 0.0;
  r.Q = 0.0;
  r.I2 = I2;
  r.included_study_count = k;
  r.n_total = n;
  r.sign_consistency = cons;
  r.feature_run_id = run;
  r.updated_at = ts;
  return r;
}

static ranked_pair tied_pair(long pair_key) {
  ranked_pair p;
  p.pair_key = pair_key;
  p.gene_a = 0;
  p.gene_b = 0;
  p.n_metrics = 1;
  p.included_study_count = 3;
  p.p_combined = 0.01;
  p.q_combined = 0.02;
  p.q_star = 0.02;
  p.i2_star = 10.0;
  p.composite_score = 2.0;
  p.power_score = 2.0;
  p.consistency_score = 1.0;
  p.combined_effect_size = 0.4;
  return p;
}

TEST(RankTest, ClampLimit) {
  bool clamped;
  ASSERT_EQ(clamp_limit(0, clamped), 1);
  ASSERT_TRUE(clamped);
  ASSERT_EQ(clamp_limit(5000, clamped), 1000);
  ASSERT_TRUE(clamped);
  ASSERT_EQ(clamp_limit(50, clamped), 50);
  ASSERT_FALSE(clamped);
}

TEST(RankTest, TieBreakOnPairKey) {
  ranked_pair a = tied_pair(7);
  ranked_pair b = tied_pair(3);
  ASSERT_TRUE(rank_before(b, a));
  ASSERT_FALSE(rank_before(a, b));
  ASSERT_FALSE(rank_before(a, a));

  a.q_star = 0.01;
  ASSERT_TRUE(rank_before(a, b));

  a = tied_pair(7);
  a.combined_effect_size = -0.9;
  ASSERT_TRUE(rank_before(a, b));
}

TEST(RankTest, ScorePairs) {
  global_opts::reset();
  vector<pooled_result> rows = {
    pooled_row(1, "a", 0.001, 0.5, numeric_limits<double>::quiet_NaN(), 3, 100, 1.0, "FR_1", "2020-01-01T00:00:00Z"),
    pooled_row(1, "b", 0.2, -0.1, 30.0, 2, 50, 0.5, "FR_2", "2020-02-01T00:00:00Z"),
    pooled_row(2, "a", 0.04, 0.3, numeric_limits<double>::quiet_NaN(), 1, 0, 1.0, "FR_1", "2020-01-01T00:00:00Z")
  };

  vector<ranked_pair> s = score_pairs(rows);
  ASSERT_EQ(s.size(), 2u);

  const ranked_pair &p1 = s[0];
  ASSERT_EQ(p1.pair_key, 1);
  ASSERT_EQ(p1.n_metrics, 2);
  ASSERT_EQ(p1.included_study_count, 2);
  ASSERT_NEAR(p1.q_star, 0.002, 1e-12);
  ASSERT_DOUBLE_EQ(p1.i2_star, 30.0);
  ASSERT_EQ(p1.lead_metric, "a");
  ASSERT_DOUBLE_EQ(p1.combined_effect_size, 0.5);
  ASSERT_EQ(p1.latest_run_id, "FR_2");
  ASSERT_NEAR(p1.power_score, log10(101.0), 1e-12);
  ASSERT_NEAR(p1.consistency_score, 0.75, 1e-12);

  // a pair with no I2 at all is treated as fully heterogeneous
  const ranked_pair &p2 = s[1];
  ASSERT_DOUBLE_EQ(p2.i2_star, 100.0);
  ASSERT_NEAR(p2.p_combined, 0.04, 1e-9);
  ASSERT_NEAR(p2.q_star, 0.04, 1e-9);
  ASSERT_NEAR(p2.composite_score, -log10(0.04), 1e-6);

  rank_query q;
  q.slice = {1, "RNA-SEQ"};
  q.q_threshold = 0.05;
  q.k_min = 2;
  q.i2_max = 50.0;
  q.limit = 100;
  ASSERT_TRUE(passes_filter(p1, q));
  ASSERT_FALSE(passes_filter(p2, q));

  q.k_min = 1;
  ASSERT_FALSE(passes_filter(p2, q));
  q.i2_max = 100.0;
  ASSERT_TRUE(passes_filter(p2, q));
}

class RankViewTest : public ::testing::Test {
  protected:
    gene_reference genes;
    disease_map diseases;
    memory_store store;

    /**
     * Three RNA-SEQ studies for SEPSIS. Every pair gets a growing spread
     * across studies, so I2 varies from pair to pair. Pairs with gene 6
     * are only seen by two studies.
     */
    void SetUp() override {
      test_opts();
      genes = fixture_genes();
      diseases = fixture_diseases();
      diseases.add_study({17, "GSE17", "RNA-SEQ"});
      diseases.add_mapping({17, 1, true, "2020-01-01", "NA"});

      aggregator agg(store, genes, diseases);
      int studies[] = {10, 11, 17};
      for (int s = 0; s < 3; s++) {
        vector<study_component> comps;
        int j = 0;
        for (int a = 1; a <= 6; a++) {
          for (int b = a + 1; b <= 6; b++) {
            j++;
            if (b == 6 && s == 2) continue;
            double theta = 0.3 + 0.08 * j * (s - 1);
            comps.push_back(effect_component(studies[s], to_string(a) + "_" + to_string(b), "logFC", theta, 0.1, 30 + 10 * s));
          }
        }
        ASSERT_TRUE(agg.run_study(studies[s], comps).ok());
      }
    }

    void TearDown() override {
      global_opts::reset();
    }

    rank_query open_query() {
      rank_query q;
      q.slice = {1, "RNA-SEQ"};
      q.q_threshold = 1.0;
      q.k_min = 1;
      q.i2_max = 100.0;
      q.limit = 1000;
      return q;
    }
};

TEST_F(RankViewTest, MonotoneInI2Max) {
  rank_query q = open_query();
  set<long> prev;
  for (double i2 : {0.0, 10.0, 25.0, 50.0, 75.0, 90.0, 100.0}) {
    q.i2_max = i2;
    vector<ranked_pair> out = rank_pairs(store, genes, q);
    set<long> cur;
    for (const ranked_pair &p : out) {
      ASSERT_LE(p.i2_star, i2);
      cur.insert(p.pair_key);
    }
    ASSERT_TRUE(includes(cur.begin(), cur.end(), prev.begin(), prev.end())) << "i2_max " << i2;
    prev = cur;
  }
  ASSERT_EQ(prev.size(), 15u);
}

TEST_F(RankViewTest, MinStudiesFilter) {
  rank_query q = open_query();
  q.k_min = 3;
  vector<ranked_pair> out = rank_pairs(store, genes, q);
  ASSERT_EQ(out.size(), 10u);
  for (const ranked_pair &p : out) {
    ASSERT_NE(p.gene_b, 6);
    ASSERT_EQ(p.included_study_count, 3);
  }
  q.k_min = 4;
  ASSERT_EQ(rank_pairs(store, genes, q).size(), 0u);
}

TEST_F(RankViewTest, SortedLimitedAndLabelled) {
  rank_query q = open_query();
  vector<ranked_pair> all = rank_pairs(store, genes, q);
  ASSERT_TRUE(is_sorted(all.begin(), all.end(), rank_before));

  q.limit = 4;
  vector<ranked_pair> top = rank_pairs(store, genes, q);
  ASSERT_EQ(top.size(), 4u);
  for (size_t i = 0; i < top.size(); i++) {
    ASSERT_EQ(top[i].pair_key, all[i].pair_key);
  }

  q.limit = 0;
  ASSERT_EQ(rank_pairs(store, genes, q).size(), 1u);

  const ranked_pair &p = all[0];
  ASSERT_LT(p.gene_a, p.gene_b);
  ASSERT_EQ(p.symbol_a, genes.symbol(p.gene_a));

  ostringstream os;
  write_ranked(top, os);
  string text = os.str();
  ASSERT_EQ(text.rfind("#rank\tpair_key", 0), 0u);
  ASSERT_EQ(count(text.begin(), text.end(), '\n'), 5);
}

TEST_F(RankViewTest, OtherSliceIsEmpty) {
  rank_query q = open_query();
  q.slice = {1, "MICROARRAY"};
  ASSERT_EQ(rank_pairs(store, genes, q).size(), 0u);
}

#include <gtest/gtest.h>
#include "setOptions.hpp"
#include "errors.hpp"
#include "statStore.hpp"
#include "metaAnalysis.hpp"
#include <sstream>
#include <string>
#include <vector>
#include "test_util.h"
using namespace std;

static stat_key key_for(long pair_key, const string &metric) {
  stat_key k;
  k.pair_key = pair_key;
  k.disease_key = 1;
  k.technology = "RNA-SEQ";
  k.metric_name = metric;
  return k;
}

/**
 * Txn adding one study's (theta, se) to a fresh row for pair (1,2).
 */
static store_txn first_txn(stat_store &store, const string &metric, double theta, double se, double n) {
  gene_reference genes = fixture_genes();
  gene_pair_index index = store.pair_snapshot();

  store_txn txn;
  txn.slice = {1, "RNA-SEQ"};
  txn.pairs_before = index.n();

  stat_key key = key_for(index.resolve(1, 2, genes), metric);
  optional<suff_stat> row = store.fetch(key);
  suff_stat ss = row ? *row : suff_stat(key, metric_kind::effect);
  txn.read_versions[key] = ss.version;
  ss.fold(10 + (int) ss.ledger.size(), theta, se, n);

  txn.new_pairs = index.created_since(txn.pairs_before);
  txn.stats.push_back(ss);
  txn.pooled.push_back(*pool_metric(ss, "FR_test", "2020-01-01T00:00:00Z", 0.95));
  return txn;
}

class failing_store : public memory_store {
  public:
    int fail_next = 0;
  protected:
    void persist_tables() override {
      if (fail_next > 0) {
        fail_next--;
        throw transient_store_error(err_code::STORE_UNAVAILABLE, "injected persist failure");
      }
    }
};

TEST(StoreTest, CommitBumpsVersion) {
  memory_store store;
  store.commit(first_txn(store, "logFC", 0.2, 0.1, 30));

  ASSERT_EQ(store.pair_snapshot().n(), 1);
  optional<suff_stat> row = store.fetch(key_for(1, "logFC"));
  ASSERT_TRUE(row.has_value());
  ASSERT_EQ(row->version, 1);
  ASSERT_EQ(row->k, 1);

  store.commit(first_txn(store, "logFC", 0.3, 0.1, 30));
  row = store.fetch(key_for(1, "logFC"));
  ASSERT_EQ(row->version, 2);
  ASSERT_EQ(row->k, 2);
  ASSERT_TRUE(store.fetch_pooled(key_for(1, "logFC")).has_value());
}

TEST(StoreTest, StaleVersionConflicts) {
  memory_store store;
  store_txn a = first_txn(store, "logFC", 0.2, 0.1, 30);
  store_txn b = first_txn(store, "logFC", 0.4, 0.1, 30);

  store.commit(a);
  try {
    store.commit(b);
    FAIL() << "stale commit accepted";
  }
  catch (const transient_store_error &e) {
    ASSERT_EQ(e.code(), err_code::STORE_CONFLICT);
  }
  ASSERT_EQ(store.fetch(key_for(1, "logFC"))->k, 1);
  ASSERT_EQ(store.pair_snapshot().n(), 1);
}

TEST(StoreTest, FailedPersistRollsBack) {
  failing_store store;
  store.fail_next = 1;

  ASSERT_THROW(store.commit(first_txn(store, "logFC", 0.2, 0.1, 30)), transient_store_error);
  ASSERT_EQ(store.pair_snapshot().n(), 0);
  ASSERT_FALSE(store.fetch(key_for(1, "logFC")).has_value());
  ASSERT_EQ(store.all_pooled().size(), 0u);

  store.commit(first_txn(store, "logFC", 0.2, 0.1, 30));
  ASSERT_EQ(store.fetch(key_for(1, "logFC"))->version, 1);
}

TEST(StoreTest, ReviewNeedsKnownPair) {
  memory_store store;
  review_verdict r = {1, "FR_x", "alice", "confirmed", "", "2020-01-01T00:00:00Z"};
  ASSERT_THROW(store.append_review(r), precondition_error);

  store.commit(first_txn(store, "logFC", 0.2, 0.1, 30));
  store.append_review(r);
  ASSERT_EQ(store.reviews().size(), 1u);
}

TEST(StoreTest, SliceLockIsPerSlice) {
  memory_store store;
  slice_key a = {1, "RNA-SEQ"};
  slice_key b = {1, "MICROARRAY"};
  unique_lock<mutex> la = store.lock_slice(a);
  unique_lock<mutex> lb = store.lock_slice(b);
  ASSERT_TRUE(la.owns_lock());
  ASSERT_TRUE(lb.owns_lock());
}

TEST(FileStoreTest, RoundTripIsBitExact) {
  string dir = scratch_dir("roundtrip");
  {
    file_store store(dir);
    store.commit(first_txn(store, "logFC", 0.123456789, 0.0731, 42));
    store.commit(first_txn(store, "logFC", -0.3333333333333333, 0.211, numeric_limits<double>::quiet_NaN()));
    store.commit(first_txn(store, "delta", 1.0/3.0, 0.5, 17));

    feature_run run = {"FR_1", 10, 1, "RNA-SEQ", "a", "b", "SUCCESS", 1, 3, 3, 0, "", ""};
    store.append_run(run);
    store.append_validation({{"FR_1", 10, "1_2", "logFC", err_code::NON_POSITIVE_SE, "WARNING", "standard error\tis 0"}});
    store.append_review({1, "FR_1", "bob", "follow up", "check\ttabs", "c"});
  }
  ASSERT_TRUE(filepath_exists(dir + "/pairs.tsv.gz"));
  ASSERT_TRUE(filepath_exists(dir + "/suffstats.tsv.gz"));
  ASSERT_TRUE(filepath_exists(dir + "/pooled.tsv.gz"));
  ASSERT_FALSE(filepath_exists(dir + "/suffstats.tsv.gz.tmp"));

  memory_store expect;
  expect.commit(first_txn(expect, "logFC", 0.123456789, 0.0731, 42));
  expect.commit(first_txn(expect, "logFC", -0.3333333333333333, 0.211, numeric_limits<double>::quiet_NaN()));
  expect.commit(first_txn(expect, "delta", 1.0/3.0, 0.5, 17));

  file_store reloaded(dir);
  ASSERT_EQ(reloaded.pair_snapshot().n(), 1);

  vector<suff_stat> a = expect.all_stats();
  vector<suff_stat> b = reloaded.all_stats();
  ASSERT_EQ(a.size(), b.size());
  for (size_t i = 0; i < a.size(); i++) {
    ASSERT_TRUE(a[i].key == b[i].key);
    ASSERT_EQ(a[i].kind, b[i].kind);
    ASSERT_EQ(a[i].version, b[i].version);
    ASSERT_EQ(a[i].S1, b[i].S1);
    ASSERT_EQ(a[i].S2, b[i].S2);
    ASSERT_EQ(a[i].St, b[i].St);
    ASSERT_EQ(a[i].St2, b[i].St2);
    ASSERT_EQ(a[i].k, b[i].k);
    ASSERT_EQ(a[i].ledger.size(), b[i].ledger.size());
    for (const auto &kv : a[i].ledger) {
      const ledger_entry &e = b[i].ledger.at(kv.first);
      ASSERT_EQ(kv.second.w, e.w);
      ASSERT_EQ(kv.second.theta, e.theta);
      ASSERT_EQ(kv.second.se, e.se);
      ASSERT_EQ(std::isnan(kv.second.n), std::isnan(e.n));
    }
  }

  vector<pooled_result> pa = expect.all_pooled();
  vector<pooled_result> pb = reloaded.all_pooled();
  ASSERT_EQ(pa.size(), pb.size());
  for (size_t i = 0; i < pa.size(); i++) {
    ASSERT_TRUE(same_pooled_values(pa[i], pb[i], 0.0));
    ASSERT_EQ(pa[i].ci_lower, pb[i].ci_lower);
  }

  ASSERT_EQ(reloaded.runs().size(), 1u);
  ASSERT_EQ(reloaded.runs()[0].status, "SUCCESS");
  ASSERT_EQ(reloaded.runs()[0].error_code, "");
  ASSERT_EQ(reloaded.validations().size(), 1u);
  ASSERT_EQ(reloaded.validations()[0].details, "standard error is 0");
  ASSERT_EQ(reloaded.reviews().size(), 1u);
  ASSERT_EQ(reloaded.reviews()[0].note, "check tabs");

  std::filesystem::remove_all(dir);
}

TEST(FileStoreTest, VerifyDetectsTampering) {
  memory_store store;
  store.commit(first_txn(store, "logFC", 0.2, 0.1, 30));
  store.commit(first_txn(store, "logFC", 0.5, 0.2, 30));

  ostringstream ok;
  ASSERT_EQ(verify_store(store, 1e-9, ok), 0);
  ASSERT_EQ(ok.str(), "");

  class tampered_store : public memory_store {
    public:
      void corrupt(const stat_key &k) { stats[k].St += 1.0; }
  } bad;
  bad.commit(first_txn(bad, "logFC", 0.2, 0.1, 30));
  bad.corrupt(key_for(1, "logFC"));

  ostringstream report;
  ASSERT_EQ(verify_store(bad, 1e-9, report), 1);
  ASSERT_NE(report.str().find("LEDGER_MISMATCH"), string::npos);
}

TEST(FileStoreTest, FailedPublishKeepsPreviousTables) {
  string dir = scratch_dir("publish");
  {
    file_store store(dir);
    store.commit(first_txn(store, "logFC", 0.2, 0.1, 30));

    // a directory where the pooled table goes makes its rename fail
    std::filesystem::remove(dir + "/pooled.tsv.gz");
    std::filesystem::create_directories(dir + "/pooled.tsv.gz/blocker");

    ASSERT_THROW(store.commit(first_txn(store, "logFC", 0.5, 0.2, 30)), transient_store_error);
    ASSERT_EQ(store.fetch(key_for(1, "logFC"))->k, 1);
  }
  ASSERT_FALSE(filepath_exists(dir + "/suffstats.tsv.gz.prev"));
  ASSERT_FALSE(filepath_exists(dir + "/suffstats.tsv.gz.tmp"));
  ASSERT_FALSE(filepath_exists(dir + "/pooled.tsv.gz.tmp"));

  std::filesystem::remove_all(dir + "/pooled.tsv.gz");
  file_store reloaded(dir);
  optional<suff_stat> row = reloaded.fetch(key_for(1, "logFC"));
  ASSERT_TRUE(row.has_value());
  ASSERT_EQ(row->k, 1);
  ASSERT_EQ(row->version, 1);
  ASSERT_EQ(row->ledger.size(), 1u);
  ASSERT_EQ(row->ledger.count(10), 1u);
  ASSERT_EQ(reloaded.pair_snapshot().n(), 1);

  std::filesystem::remove_all(dir);
}

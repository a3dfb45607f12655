/*
    Copyright (C) 2020
    Author: Corbin Quick <qcorbin@hsph.harvard.edu>

    This file is a part of PAIRMETA.

    PAIRMETA is distributed "AS IS" in the hope that it will be
    useful, but WITHOUT ANY WARRANTY; without even the implied
    warranty of MERCHANTABILITY, NON-INFRINGEMENT, or FITNESS
    FOR A PARTICULAR PURPOSE.

    The above copyright notice and disclaimer of warranty must
    be included in all copies or substantial portions of PAIRMETA.
*/

/*
	SUFFICIENT-STATISTICS STORE

	Holds the gene pair registry, the suff_stat rows and the pooled fact
	table, plus the append-only run, validation and review logs.

	Writers work on copies and hand the store a store_txn. commit() is
	all-or-nothing: it checks the pair registry size and the version of
	every row the run read (optimistic concurrency), applies everything
	under one mutex, and rolls back if persisting fails. A mismatch raises
	StoreConflict; an I/O failure raises StoreUnavailable. Both are
	transient_store_error and the caller retries the whole study update.

	Runs on the same (disease, technology) slice additionally serialize
	on an advisory per-slice lock from lock_slice().

	memory_store keeps everything in memory. file_store extends it with a
	directory of BGZF tables (rewritten through a temp file and renamed on
	every commit) and plain TSV logs (appended).
*/

#ifndef PAIRMETA_STATSTORE_HPP
#define PAIRMETA_STATSTORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "mapID.hpp"
#include "suffStats.hpp"
#include "metaAnalysis.hpp"

struct feature_run
{
	std::string feature_run_id;
	int triggered_by_study_key;
	int disease_key;          // -1 when never resolved
	std::string technology;   // NA when never resolved
	std::string started_at;
	std::string ended_at;
	std::string status;       // SUCCESS or FAILED
	int attempts;
	int records_read;
	int records_applied;
	int records_rejected;
	std::string error_code;
	std::string error_message;
};

struct validation_record
{
	std::string feature_run_id;
	int study_key;
	std::string pair_id;
	std::string metric_name;
	std::string validation_code;
	std::string severity;
	std::string details;
};

struct review_verdict
{
	long pair_key;
	std::string feature_run_id;
	std::string reviewer;
	std::string verdict;
	std::string note;
	std::string created_at;
};

struct slice_key
{
	int disease_key;
	std::string technology;

	bool operator<(const slice_key& o) const {
		return disease_key < o.disease_key || ( disease_key == o.disease_key && technology < o.technology );
	};
	std::string to_string() const { return std::to_string(disease_key) + "/" + technology; };
};

// Everything one study update writes, staged outside the store.
struct store_txn
{
	slice_key slice;
	long pairs_before;
	std::vector<gene_pair> new_pairs;
	std::map<stat_key, long> read_versions; // 0 for rows that did not exist
	std::vector<suff_stat> stats;
	std::vector<pooled_result> pooled;
};

class stat_store
{
	public:
		virtual ~stat_store() {};

		// Consistent copy of the pair registry.
		virtual gene_pair_index pair_snapshot() const = 0;

		virtual std::optional<suff_stat> fetch(const stat_key&) const = 0;
		virtual std::optional<pooled_result> fetch_pooled(const stat_key&) const = 0;

		virtual void commit(const store_txn&) = 0;

		virtual std::vector<pooled_result> pooled_slice(const slice_key&) const = 0;
		virtual std::vector<suff_stat> all_stats() const = 0;
		virtual std::vector<pooled_result> all_pooled() const = 0;

		virtual void append_run(const feature_run&) = 0;
		virtual void append_validation(const std::vector<validation_record>&) = 0;
		virtual void append_review(const review_verdict&) = 0;

		virtual std::vector<feature_run> runs() const = 0;
		virtual std::vector<validation_record> validations() const = 0;
		virtual std::vector<review_verdict> reviews() const = 0;

		virtual std::unique_lock<std::mutex> lock_slice(const slice_key&) = 0;
};

class memory_store : public stat_store
{
	public:
		gene_pair_index pair_snapshot() const override;

		std::optional<suff_stat> fetch(const stat_key&) const override;
		std::optional<pooled_result> fetch_pooled(const stat_key&) const override;

		void commit(const store_txn&) override;

		std::vector<pooled_result> pooled_slice(const slice_key&) const override;
		std::vector<suff_stat> all_stats() const override;
		std::vector<pooled_result> all_pooled() const override;

		void append_run(const feature_run&) override;
		void append_validation(const std::vector<validation_record>&) override;
		void append_review(const review_verdict&) override;

		std::vector<feature_run> runs() const override;
		std::vector<validation_record> validations() const override;
		std::vector<review_verdict> reviews() const override;

		std::unique_lock<std::mutex> lock_slice(const slice_key&) override;

	protected:
		// Called with the store mutex held after a txn has been applied in
		// memory. Throwing rolls the txn back.
		virtual void persist_tables() {};
		virtual void persist_run(const feature_run&) {};
		virtual void persist_validation(const std::vector<validation_record>&) {};
		virtual void persist_review(const review_verdict&) {};

		mutable std::mutex mtx;

		gene_pair_index pairs;
		std::map<stat_key, suff_stat> stats;
		std::map<stat_key, pooled_result> pooled;

		std::vector<feature_run> run_log;
		std::vector<validation_record> validation_log;
		std::vector<review_verdict> review_log;

	private:
		std::mutex slice_mtx;
		std::map<slice_key, std::unique_ptr<std::mutex>> slice_locks;
};

class file_store : public memory_store
{
	public:
		// Creates the directory if needed and loads any existing tables.
		file_store(const std::string& dir);

		const std::string& directory() const { return dir; };

	protected:
		void persist_tables() override;
		void persist_run(const feature_run&) override;
		void persist_validation(const std::vector<validation_record>&) override;
		void persist_review(const review_verdict&) override;

	private:
		std::string dir;

		void load();
		void load_pairs(const std::string&);
		void load_stats(const std::string&);
		void load_pooled(const std::string&);
		void load_runs(const std::string&);
		void load_validations(const std::string&);
		void load_reviews(const std::string&);

		std::string path(const std::string& fn) const { return dir + "/" + fn; };
};

// Replays every ledger and recomputes every pooled row; writes one line
// per mismatch to os and returns the number of mismatches.
int verify_store(const stat_store& store, const double& rel_tol, std::ostream& os);

#endif

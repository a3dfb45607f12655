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

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

#include "statStore.hpp"
#include "htsWrappers.hpp"

static const std::string PAIRS_FILE = "pairs.tsv.gz";
static const std::string STATS_FILE = "suffstats.tsv.gz";
static const std::string POOLED_FILE = "pooled.tsv.gz";
static const std::string RUNS_FILE = "runs.tsv";
static const std::string VALIDATION_FILE = "validation.tsv";
static const std::string REVIEWS_FILE = "reviews.tsv";

static const std::vector<std::string> pair_cols{"pair_key", "gene_a_key", "gene_b_key"};

static const std::vector<std::string> stat_cols{
	"pair_key", "disease_key", "technology", "metric_name", "kind", "version",
	"S1", "S2", "Stheta", "Stheta2", "k",
	"study_key", "w", "theta", "se", "n"
};

static const std::vector<std::string> run_cols{
	"feature_run_id", "triggered_by_study_key", "disease_key", "technology",
	"started_at", "ended_at", "status", "attempts", "records_read",
	"records_applied", "records_rejected", "error_code", "error_message"
};

static const std::vector<std::string> validation_cols{
	"feature_run_id", "study_key", "pair_id", "metric_name",
	"validation_code", "severity", "details"
};

static const std::vector<std::string> review_cols{
	"pair_key", "feature_run_id", "reviewer", "verdict", "note", "created_at"
};

// Log fields are tab-separated and never empty.
static std::string log_field(const std::string& x)
{
	std::string out = x;
	for( char& c : out ){
		if( c == '\t' || c == '\n' || c == '\r' ) c = ' ';
	}
	out = trim_string(out);
	if( out == "" ) return NA_STRING;
	return out;
}

static std::string from_log_field(const std::string& x)
{
	return x == NA_STRING ? "" : x;
}

// ------------------------------------
//  memory_store
// ------------------------------------

gene_pair_index memory_store::pair_snapshot() const
{
	std::lock_guard<std::mutex> lk(mtx);
	return pairs;
}

std::optional<suff_stat> memory_store::fetch(const stat_key& key) const
{
	std::lock_guard<std::mutex> lk(mtx);
	auto it = stats.find(key);
	if( it == stats.end() ){
		return std::nullopt;
	}
	return it->second;
}

std::optional<pooled_result> memory_store::fetch_pooled(const stat_key& key) const
{
	std::lock_guard<std::mutex> lk(mtx);
	auto it = pooled.find(key);
	if( it == pooled.end() ){
		return std::nullopt;
	}
	return it->second;
}

void memory_store::commit(const store_txn& txn)
{
	std::lock_guard<std::mutex> lk(mtx);

	if( txn.pairs_before != pairs.n() ){
		throw transient_store_error(err_code::STORE_CONFLICT, "pair registry changed during the run (" + std::to_string(txn.pairs_before) + " -> " + std::to_string(pairs.n()) + " pairs)");
	}
	for( const auto& rv : txn.read_versions ){
		auto it = stats.find(rv.first);
		long current = it == stats.end() ? 0 : it->second.version;
		if( current != rv.second ){
			throw transient_store_error(err_code::STORE_CONFLICT, "row " + rv.first.to_string() + " changed during the run (version " + std::to_string(rv.second) + " -> " + std::to_string(current) + ")");
		}
	}
	for( const suff_stat& s : txn.stats ){
		if( txn.read_versions.find(s.key) == txn.read_versions.end() ){
			throw std::logic_error("txn writes row " + s.key.to_string() + " it never read");
		}
	}

	// keep what we overwrite so a failed persist can be undone
	gene_pair_index pairs_old = pairs;
	std::vector<std::pair<stat_key, std::optional<suff_stat>>> stats_old;
	std::vector<std::pair<stat_key, std::optional<pooled_result>>> pooled_old;

	for( const gene_pair& gp : txn.new_pairs ){
		pairs.insert(gp);
	}
	for( const suff_stat& s : txn.stats ){
		auto it = stats.find(s.key);
		if( it == stats.end() ){
			stats_old.push_back(std::make_pair(s.key, std::optional<suff_stat>()));
		}else{
			stats_old.push_back(std::make_pair(s.key, std::optional<suff_stat>(it->second)));
		}
		suff_stat row = s;
		row.version = txn.read_versions.at(s.key) + 1;
		stats[s.key] = row;
	}
	for( const pooled_result& p : txn.pooled ){
		auto it = pooled.find(p.key);
		if( it == pooled.end() ){
			pooled_old.push_back(std::make_pair(p.key, std::optional<pooled_result>()));
		}else{
			pooled_old.push_back(std::make_pair(p.key, std::optional<pooled_result>(it->second)));
		}
		pooled[p.key] = p;
	}

	try{
		persist_tables();
	}catch( const transient_store_error& ){
		pairs = pairs_old;
		for( const auto& kv : stats_old ){
			if( kv.second ) stats[kv.first] = *kv.second;
			else stats.erase(kv.first);
		}
		for( const auto& kv : pooled_old ){
			if( kv.second ) pooled[kv.first] = *kv.second;
			else pooled.erase(kv.first);
		}
		throw;
	}
}

std::vector<pooled_result> memory_store::pooled_slice(const slice_key& slice) const
{
	std::lock_guard<std::mutex> lk(mtx);
	std::vector<pooled_result> out;
	for( const auto& kv : pooled ){
		if( kv.first.disease_key == slice.disease_key && kv.first.technology == slice.technology ){
			out.push_back(kv.second);
		}
	}
	return out;
}

std::vector<suff_stat> memory_store::all_stats() const
{
	std::lock_guard<std::mutex> lk(mtx);
	std::vector<suff_stat> out;
	for( const auto& kv : stats ) out.push_back(kv.second);
	return out;
}

std::vector<pooled_result> memory_store::all_pooled() const
{
	std::lock_guard<std::mutex> lk(mtx);
	std::vector<pooled_result> out;
	for( const auto& kv : pooled ) out.push_back(kv.second);
	return out;
}

void memory_store::append_run(const feature_run& r)
{
	std::lock_guard<std::mutex> lk(mtx);
	persist_run(r);
	run_log.push_back(r);
}

void memory_store::append_validation(const std::vector<validation_record>& v)
{
	if( v.size() == 0 ) return;
	std::lock_guard<std::mutex> lk(mtx);
	persist_validation(v);
	validation_log.insert(validation_log.end(), v.begin(), v.end());
}

void memory_store::append_review(const review_verdict& r)
{
	std::lock_guard<std::mutex> lk(mtx);
	if( !pairs.has_pair(r.pair_key) ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, "unknown pair_key " + std::to_string(r.pair_key));
	}
	persist_review(r);
	review_log.push_back(r);
}

std::vector<feature_run> memory_store::runs() const
{
	std::lock_guard<std::mutex> lk(mtx);
	return run_log;
}

std::vector<validation_record> memory_store::validations() const
{
	std::lock_guard<std::mutex> lk(mtx);
	return validation_log;
}

std::vector<review_verdict> memory_store::reviews() const
{
	std::lock_guard<std::mutex> lk(mtx);
	return review_log;
}

std::unique_lock<std::mutex> memory_store::lock_slice(const slice_key& slice)
{
	std::mutex* m;
	{
		std::lock_guard<std::mutex> lk(slice_mtx);
		std::unique_ptr<std::mutex>& p = slice_locks[slice];
		if( !p ) p.reset(new std::mutex);
		m = p.get();
	}
	return std::unique_lock<std::mutex>(*m);
}

// ------------------------------------
//  file_store
// ------------------------------------

file_store::file_store(const std::string& dir_) : dir(dir_)
{
	std::error_code ec;
	std::filesystem::create_directories(dir, ec);
	if( ec ){
		throw transient_store_error(err_code::STORE_UNAVAILABLE, "cannot create store directory " + dir + ": " + ec.message());
	}
	load();
}

void file_store::load()
{
	try{
		if( file_exists(path(PAIRS_FILE)) ) load_pairs(path(PAIRS_FILE));
		if( file_exists(path(STATS_FILE)) ) load_stats(path(STATS_FILE));
		if( file_exists(path(POOLED_FILE)) ) load_pooled(path(POOLED_FILE));
		if( file_exists(path(RUNS_FILE)) ) load_runs(path(RUNS_FILE));
		if( file_exists(path(VALIDATION_FILE)) ) load_validations(path(VALIDATION_FILE));
		if( file_exists(path(REVIEWS_FILE)) ) load_reviews(path(REVIEWS_FILE));
	}catch( const pairmeta_error& ){
		throw;
	}catch( const std::runtime_error& e ){
		throw transient_store_error(err_code::STORE_UNAVAILABLE, e.what());
	}
	std::cerr << "Loaded store " << dir << ": " << pairs.n() << " pairs, " << stats.size() << " statistics rows, " << pooled.size() << " pooled rows.\n";
}

static void check_fields(const std::vector<std::string>& v, const size_t& n, const std::string& fn, const int& line_no)
{
	if( v.size() != n ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, fn + " line " + std::to_string(line_no) + ": expected " + std::to_string(n) + " fields, found " + std::to_string(v.size()));
	}
}

static long field_long(const std::string& x, const std::string& fn, const int& line_no)
{
	long out;
	if( !parse_long(x, out) ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, fn + " line " + std::to_string(line_no) + ": invalid integer '" + x + "'");
	}
	return out;
}

static double field_double(const std::string& x, const std::string& fn, const int& line_no)
{
	if( x == NA_STRING ){
		return std::numeric_limits<double>::quiet_NaN();
	}
	double out;
	if( !parse_double(x, out) ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, fn + " line " + std::to_string(line_no) + ": invalid number '" + x + "'");
	}
	return out;
}

void file_store::load_pairs(const std::string& fn)
{
	read_tsv(fn, [&](const std::vector<std::string>& v, const int& ln){
		check_fields(v, pair_cols.size(), fn, ln);
		gene_pair gp;
		gp.pair_key = field_long(v[0], fn, ln);
		gp.gene_a = field_long(v[1], fn, ln);
		gp.gene_b = field_long(v[2], fn, ln);
		pairs.insert(gp);
	});
}

void file_store::load_stats(const std::string& fn)
{
	read_tsv(fn, [&](const std::vector<std::string>& v, const int& ln){
		check_fields(v, stat_cols.size(), fn, ln);

		stat_key key;
		key.pair_key = field_long(v[0], fn, ln);
		key.disease_key = field_long(v[1], fn, ln);
		key.technology = v[2];
		key.metric_name = v[3];

		auto it = stats.find(key);
		if( it == stats.end() ){
			suff_stat s(key, parse_kind(v[4]));
			s.version = field_long(v[5], fn, ln);
			// sums are taken as stored, not replayed, so they round-trip exactly
			s.S1 = field_double(v[6], fn, ln);
			s.S2 = field_double(v[7], fn, ln);
			s.St = field_double(v[8], fn, ln);
			s.St2 = field_double(v[9], fn, ln);
			s.k = field_long(v[10], fn, ln);
			it = stats.insert(std::make_pair(key, s)).first;
		}

		if( v[11] != NA_STRING ){
			ledger_entry e;
			e.w = field_double(v[12], fn, ln);
			e.theta = field_double(v[13], fn, ln);
			e.se = field_double(v[14], fn, ln);
			e.n = field_double(v[15], fn, ln);
			it->second.ledger[field_long(v[11], fn, ln)] = e;
		}
	});
}

void file_store::load_pooled(const std::string& fn)
{
	read_tsv(fn, [&](const std::vector<std::string>& v, const int& ln){
		check_fields(v, pooled_columns().size(), fn, ln);
		pooled_result r;
		r.key.pair_key = field_long(v[0], fn, ln);
		r.key.disease_key = field_long(v[1], fn, ln);
		r.key.technology = v[2];
		r.key.metric_name = v[3];
		r.kind = parse_kind(v[4]);
		r.theta_pooled = field_double(v[5], fn, ln);
		r.se_pooled = field_double(v[6], fn, ln);
		r.ci_lower = field_double(v[7], fn, ln);
		r.ci_upper = field_double(v[8], fn, ln);
		r.theta_fixed = field_double(v[9], fn, ln);
		r.tau2 = field_double(v[10], fn, ln);
		r.Q = field_double(v[11], fn, ln);
		r.I2 = field_double(v[12], fn, ln);
		r.z = field_double(v[13], fn, ln);
		r.pval = field_double(v[14], fn, ln);
		r.included_study_count = field_long(v[15], fn, ln);
		r.n_total = field_double(v[16], fn, ln);
		r.sign_consistency = field_double(v[17], fn, ln);
		r.feature_run_id = v[18];
		r.updated_at = v[19];
		pooled[r.key] = r;
	});
}

void file_store::load_runs(const std::string& fn)
{
	read_tsv(fn, [&](const std::vector<std::string>& v, const int& ln){
		check_fields(v, run_cols.size(), fn, ln);
		feature_run r;
		r.feature_run_id = v[0];
		r.triggered_by_study_key = field_long(v[1], fn, ln);
		r.disease_key = field_long(v[2], fn, ln);
		r.technology = from_log_field(v[3]);
		r.started_at = v[4];
		r.ended_at = v[5];
		r.status = v[6];
		r.attempts = field_long(v[7], fn, ln);
		r.records_read = field_long(v[8], fn, ln);
		r.records_applied = field_long(v[9], fn, ln);
		r.records_rejected = field_long(v[10], fn, ln);
		r.error_code = from_log_field(v[11]);
		r.error_message = from_log_field(v[12]);
		run_log.push_back(r);
	});
}

void file_store::load_validations(const std::string& fn)
{
	read_tsv(fn, [&](const std::vector<std::string>& v, const int& ln){
		check_fields(v, validation_cols.size(), fn, ln);
		validation_record r;
		r.feature_run_id = v[0];
		r.study_key = field_long(v[1], fn, ln);
		r.pair_id = from_log_field(v[2]);
		r.metric_name = from_log_field(v[3]);
		r.validation_code = v[4];
		r.severity = v[5];
		r.details = from_log_field(v[6]);
		validation_log.push_back(r);
	});
}

void file_store::load_reviews(const std::string& fn)
{
	read_tsv(fn, [&](const std::vector<std::string>& v, const int& ln){
		check_fields(v, review_cols.size(), fn, ln);
		review_verdict r;
		r.pair_key = field_long(v[0], fn, ln);
		r.feature_run_id = v[1];
		r.reviewer = v[2];
		r.verdict = v[3];
		r.note = from_log_field(v[4]);
		r.created_at = v[5];
		review_log.push_back(r);
	});
}

void file_store::persist_tables()
{
	try{
		bgzf_table_writer pw(path(PAIRS_FILE));
		pw.write_header(pair_cols);
		for( const gene_pair& gp : pairs.all() ){
			pw.write_row({std::to_string(gp.pair_key), std::to_string(gp.gene_a), std::to_string(gp.gene_b)});
		}

		bgzf_table_writer sw(path(STATS_FILE));
		sw.write_header(stat_cols);
		for( const auto& kv : stats ){
			const suff_stat& s = kv.second;
			std::vector<std::string> row{
				std::to_string(s.key.pair_key), std::to_string(s.key.disease_key),
				s.key.technology, s.key.metric_name, kind_name(s.kind),
				std::to_string(s.version),
				format_double(s.S1), format_double(s.S2),
				format_double(s.St), format_double(s.St2),
				std::to_string(s.k)
			};
			if( s.ledger.size() == 0 ){
				std::vector<std::string> out = row;
				out.insert(out.end(), {NA_STRING, NA_STRING, NA_STRING, NA_STRING, NA_STRING});
				sw.write_row(out);
			}
			for( const auto& e : s.ledger ){
				std::vector<std::string> out = row;
				out.insert(out.end(), {
					std::to_string(e.first), format_double(e.second.w),
					format_double(e.second.theta), format_double(e.second.se),
					format_double(e.second.n)
				});
				sw.write_row(out);
			}
		}

		bgzf_table_writer rw(path(POOLED_FILE));
		rw.write_header(pooled_columns());
		for( const auto& kv : pooled ){
			rw.write_row(pooled_fields(kv.second));
		}

		// pairs first: a stats row never points at a pair that is not on disk
		commit_tables({&pw, &sw, &rw});
	}catch( const std::runtime_error& e ){
		throw transient_store_error(err_code::STORE_UNAVAILABLE, e.what());
	}
}

static void append_lines(const std::string& fn, const std::vector<std::string>& cols, const std::vector<std::vector<std::string>>& rows)
{
	bool new_file = !file_exists(fn);
	std::ofstream out(fn, std::ios::app);
	if( !out ){
		throw transient_store_error(err_code::STORE_UNAVAILABLE, "cannot open " + fn + " for appending");
	}
	if( new_file ){
		print_header(cols, out);
	}
	for( const std::vector<std::string>& row : rows ){
		for( size_t i = 0; i < row.size(); i++ ){
			if( i > 0 ) out << "\t";
			out << log_field(row[i]);
		}
		out << "\n";
	}
	out.flush();
	if( !out ){
		throw transient_store_error(err_code::STORE_UNAVAILABLE, "write to " + fn + " failed");
	}
}

void file_store::persist_run(const feature_run& r)
{
	append_lines(path(RUNS_FILE), run_cols, {{
		r.feature_run_id, std::to_string(r.triggered_by_study_key),
		std::to_string(r.disease_key), r.technology, r.started_at, r.ended_at,
		r.status, std::to_string(r.attempts), std::to_string(r.records_read),
		std::to_string(r.records_applied), std::to_string(r.records_rejected),
		r.error_code, r.error_message
	}});
}

void file_store::persist_validation(const std::vector<validation_record>& v)
{
	std::vector<std::vector<std::string>> rows;
	for( const validation_record& r : v ){
		rows.push_back({
			r.feature_run_id, std::to_string(r.study_key), r.pair_id,
			r.metric_name, r.validation_code, r.severity, r.details
		});
	}
	append_lines(path(VALIDATION_FILE), validation_cols, rows);
}

void file_store::persist_review(const review_verdict& r)
{
	append_lines(path(REVIEWS_FILE), review_cols, {{
		std::to_string(r.pair_key), r.feature_run_id, r.reviewer,
		r.verdict, r.note, r.created_at
	}});
}

// ------------------------------------
//  verification
// ------------------------------------

int verify_store(const stat_store& store, const double& rel_tol, std::ostream& os)
{
	int n_bad = 0;

	std::map<stat_key, pooled_result> pooled;
	for( const pooled_result& p : store.all_pooled() ){
		pooled[p.key] = p;
	}

	for( const suff_stat& s : store.all_stats() ){
		if( !s.consistent(rel_tol) ){
			suff_stat r = s.replayed();
			os << s.key.to_string() << "\tLEDGER_MISMATCH\tk=" << s.k << "/" << r.k
				<< " S1=" << format_double(s.S1) << "/" << format_double(r.S1)
				<< " Stheta=" << format_double(s.St) << "/" << format_double(r.St) << "\n";
			n_bad++;
			pooled.erase(s.key);
			continue;
		}
		auto it = pooled.find(s.key);
		std::optional<pooled_result> expect = pool_metric(s, "", "");
		if( !expect ){
			if( it != pooled.end() ){
				os << s.key.to_string() << "\tPOOLED_WITHOUT_STUDIES\n";
				n_bad++;
			}
			continue;
		}
		if( it == pooled.end() ){
			os << s.key.to_string() << "\tPOOLED_MISSING\n";
			n_bad++;
		}else if( !same_pooled_values(it->second, *expect, 1e-6) ){
			os << s.key.to_string() << "\tPOOLED_MISMATCH\ttheta=" << format_double(it->second.theta_pooled) << "/" << format_double(expect->theta_pooled) << "\n";
			n_bad++;
		}
		if( it != pooled.end() ) pooled.erase(it);
	}

	for( const auto& kv : pooled ){
		os << kv.first.to_string() << "\tPOOLED_ORPHAN\n";
		n_bad++;
	}

	return n_bad;
}

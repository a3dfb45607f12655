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

#include <map>
#include <set>
#include <thread>
#include <tuple>

#include "aggregator.hpp"

std::atomic<long> aggregator::run_seq(0);

std::string state_name(const run_state& s)
{
	switch( s ){
		case run_state::pending: return "PENDING";
		case run_state::resolving_disease: return "RESOLVING_DISEASE";
		case run_state::updating_stats: return "UPDATING_STATS";
		case run_state::recomputing_pooled: return "RECOMPUTING_POOLED";
		case run_state::committed: return "COMMITTED";
		case run_state::failed: return "FAILED";
	}
	return "UNKNOWN";
}

std::string aggregator::mint_run_id(const int& study_key)
{
	long seq = ++run_seq;
	return "FR_" + utc_compact_timestamp() + "_" + std::to_string(study_key) + "_" + string_format("%04ld", seq);
}

void aggregator::transition(run_report& rep, const run_state& s)
{
	rep.state = s;
	std::cerr << "Run " << rep.run.feature_run_id << ": " << state_name(s) << "\n";
}

void aggregator::check_timeout(const run_report& rep, const std::string& where) const
{
	if( global_opts::run_timeout_sec <= 0 ){
		return;
	}
	double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - rep.started).count();
	if( elapsed > global_opts::run_timeout_sec ){
		throw run_failure(err_code::RUN_TIMEOUT, "run exceeded " + format_double(global_opts::run_timeout_sec) + "s " + where);
	}
}

std::vector<aggregator::staged_contribution> aggregator::check_preconditions(const int& study_key, const std::vector<study_component>& components, run_report& rep, std::vector<skipped_contribution>& skipped)
{
	std::vector<staged_contribution> out;

	std::set<std::tuple<int,int,std::string>> seen;
	std::map<std::string, metric_kind> kinds;

	for( const study_component& c : components ){

		error_context ctx(std::to_string(c.study_key), c.pair_id, c.metric_name);

		if( c.study_key != study_key ){
			throw precondition_error(err_code::FOREIGN_STUDY_COMPONENT, "component belongs to study " + std::to_string(c.study_key) + ", not the triggering study " + std::to_string(study_key), ctx);
		}

		std::pair<int,int> ab = parse_pair_id(c.pair_id);
		ab = canonical_order(ab.first, ab.second);
		for( const int& g : {ab.first, ab.second} ){
			if( !genes.has(g) ){
				throw precondition_error(err_code::PAIR_GENE_KEY_NOT_FOUND, "gene key " + std::to_string(g) + " is not in the gene reference", ctx);
			}
		}

		if( !seen.insert(std::make_tuple(ab.first, ab.second, c.metric_name)).second ){
			throw precondition_error(err_code::DUPLICATE_COMPONENT, "the same pair and metric appear more than once for this study", ctx);
		}

		auto k = kinds.find(c.metric_name);
		if( k == kinds.end() ){
			kinds[c.metric_name] = c.kind;
		}else if( k->second != c.kind ){
			throw precondition_error(err_code::METRIC_KIND_MISMATCH, "metric is given as both effect and correlation", ctx);
		}

		staged_contribution s;
		s.gene_a = ab.first;
		s.gene_b = ab.second;
		s.comp = &c;

		std::string code, details;
		if( !prepare_contribution(c, global_opts::min_correlation_n, s.c, code, details) ){
			validation_record v;
			v.feature_run_id = rep.run.feature_run_id;
			v.study_key = study_key;
			v.pair_id = c.pair_id;
			v.metric_name = c.metric_name;
			v.validation_code = code;
			v.severity = "WARNING";
			v.details = details;
			skipped.push_back({ab.first, ab.second, &c, rep.warnings.size()});
			rep.warnings.push_back(v);
			std::cerr << "Warning: " << code << ": " << details << " (" << ctx.to_string() << "); contribution skipped.\n";
			continue;
		}
		out.push_back(s);
	}
	return out;
}

void aggregator::attempt(const int& study_key, const slice_key& slice, const std::vector<staged_contribution>& staged, run_report& rep)
{
	std::unique_lock<std::mutex> slice_lock = store.lock_slice(slice);

	transition(rep, run_state::updating_stats);

	gene_pair_index index = store.pair_snapshot();

	store_txn txn;
	txn.slice = slice;
	txn.pairs_before = index.n();

	std::map<stat_key, suff_stat> working;
	std::set<stat_key> changed;

	for( const staged_contribution& s : staged ){

		stat_key key;
		key.pair_key = index.resolve(s.gene_a, s.gene_b, genes);
		key.disease_key = slice.disease_key;
		key.technology = slice.technology;
		key.metric_name = s.comp->metric_name;

		auto it = working.find(key);
		if( it == working.end() ){
			std::optional<suff_stat> row = store.fetch(key);
			if( row ){
				if( row->kind != s.comp->kind ){
					throw precondition_error(err_code::METRIC_KIND_MISMATCH,
						"stored row is " + kind_name(row->kind) + ", component is " + kind_name(s.comp->kind),
						error_context(std::to_string(study_key), s.comp->pair_id, s.comp->metric_name));
				}
				txn.read_versions[key] = row->version;
				it = working.insert(std::make_pair(key, *row)).first;
			}else{
				txn.read_versions[key] = 0;
				it = working.insert(std::make_pair(key, suff_stat(key, s.comp->kind))).first;
			}
		}

		if( it->second.fold(study_key, s.c.theta, s.c.se, s.c.n) != fold_outcome::unchanged ){
			changed.insert(key);
		}
	}

	txn.new_pairs = index.created_since(txn.pairs_before);

	transition(rep, run_state::recomputing_pooled);

	// rows this study did not change still get their pooled row checked, so
	// a pooled row left behind by an earlier failure is rewritten
	std::vector<suff_stat> unchanged;
	for( const auto& kv : working ){
		if( changed.count(kv.first) ){
			txn.stats.push_back(kv.second);
		}else{
			unchanged.push_back(kv.second);
		}
	}

	std::string ts = utc_timestamp();
	std::vector<std::optional<pooled_result>> pooled(txn.stats.size());
	std::vector<std::optional<pooled_result>> recheck(unchanged.size());

	#pragma omp parallel for schedule(dynamic)
	for( int i = 0; i < (int) txn.stats.size(); i++ ){
		pooled[i] = pool_metric(txn.stats[i], rep.run.feature_run_id, ts, global_opts::ci_level);
	}
	#pragma omp parallel for schedule(dynamic)
	for( int i = 0; i < (int) unchanged.size(); i++ ){
		recheck[i] = pool_metric(unchanged[i], rep.run.feature_run_id, ts, global_opts::ci_level);
	}

	for( const std::optional<pooled_result>& p : pooled ){
		if( p ) txn.pooled.push_back(*p);
	}
	int repaired = 0;
	for( size_t i = 0; i < unchanged.size(); i++ ){
		if( !recheck[i] ) continue;
		std::optional<pooled_result> stored = store.fetch_pooled(unchanged[i].key);
		if( !stored || !same_pooled_values(*stored, *recheck[i], 1e-9) ){
			std::cerr << "Warning: pooled row " << unchanged[i].key.to_string() << " is stale; rewriting it.\n";
			txn.pooled.push_back(*recheck[i]);
			repaired++;
		}
	}

	check_timeout(rep, "before commit");

	if( txn.stats.size() > 0 || txn.new_pairs.size() > 0 || txn.pooled.size() > 0 ){
		store.commit(txn);
	}

	rep.rows_changed = txn.stats.size();
	rep.pairs_created = txn.new_pairs.size();
	rep.pooled_repaired = repaired;
}

void aggregator::note_kept_contributions(const int& study_key, const slice_key& slice, const std::vector<skipped_contribution>& skipped, run_report& rep)
{
	if( skipped.size() == 0 ){
		return;
	}
	gene_pair_index index = store.pair_snapshot();
	for( const skipped_contribution& s : skipped ){
		long pk = index.find(s.gene_a, s.gene_b);
		if( pk < 0 ) continue;

		stat_key key;
		key.pair_key = pk;
		key.disease_key = slice.disease_key;
		key.technology = slice.technology;
		key.metric_name = s.comp->metric_name;

		std::optional<suff_stat> row = store.fetch(key);
		if( row && row->ledger.count(study_key) ){
			rep.warnings[s.warning].details += "; previous contribution from this study kept";
		}
	}
}

run_report aggregator::run_study(const int& study_key, const std::vector<study_component>& components)
{
	run_report rep;
	rep.started = std::chrono::steady_clock::now();
	rep.rows_changed = 0;
	rep.pairs_created = 0;
	rep.pooled_repaired = 0;

	feature_run& run = rep.run;
	run.feature_run_id = mint_run_id(study_key);
	run.triggered_by_study_key = study_key;
	run.disease_key = -1;
	run.technology = NA_STRING;
	run.started_at = utc_timestamp();
	run.attempts = 0;
	run.records_read = components.size();
	run.records_applied = 0;
	run.records_rejected = 0;

	transition(rep, run_state::pending);

	try{
		transition(rep, run_state::resolving_disease);

		const study_record& study = diseases.study(study_key);
		const disease_record& disease = diseases.resolve(study_key);

		slice_key slice;
		slice.disease_key = disease.disease_key;
		slice.technology = study.technology;

		run.disease_key = slice.disease_key;
		run.technology = slice.technology;

		std::cerr << "Study " << study_key << " (" << study.accession << ") -> disease " << disease.label << ", technology " << study.technology << ".\n";

		std::vector<skipped_contribution> skipped;
		std::vector<staged_contribution> staged = check_preconditions(study_key, components, rep, skipped);
		run.records_rejected = rep.warnings.size();

		for( int a = 1; ; a++ ){
			run.attempts = a;
			check_timeout(rep, "before attempt " + std::to_string(a));
			try{
				attempt(study_key, slice, staged, rep);
				break;
			}catch( const transient_store_error& e ){
				std::cerr << "Warning: attempt " << a << " of " << global_opts::max_attempts << " failed: " << e.what() << "\n";
				if( a >= global_opts::max_attempts ){
					throw run_failure(err_code::RETRIES_EXHAUSTED, "gave up after " + std::to_string(a) + " attempts; last error: " + e.what(), error_context(std::to_string(study_key)));
				}
				long wait_ms = (long) global_opts::backoff_ms << (a - 1);
				if( global_opts::run_timeout_sec > 0 ){
					double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - rep.started).count();
					if( elapsed + wait_ms/1000.0 > global_opts::run_timeout_sec ){
						throw run_failure(err_code::RUN_TIMEOUT, "run would exceed " + format_double(global_opts::run_timeout_sec) + "s while backing off", error_context(std::to_string(study_key)));
					}
				}
				std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
			}
		}

		note_kept_contributions(study_key, slice, skipped, rep);

		run.records_applied = staged.size();
		run.status = "SUCCESS";
		transition(rep, run_state::committed);

		std::cerr << "Study " << study_key << ": " << run.records_applied << " contributions applied, "
			<< run.records_rejected << " rejected, " << rep.rows_changed << " rows updated, "
			<< rep.pairs_created << " new pairs.\n";

	}catch( const pairmeta_error& e ){
		run.status = "FAILED";
		run.error_code = e.code();
		run.error_message = e.what();
		rep.rows_changed = 0;
		rep.pairs_created = 0;
		rep.pooled_repaired = 0;
		run.records_applied = 0;
		transition(rep, run_state::failed);
		std::cerr << "Error: " << e.what() << "\n";
	}

	run.ended_at = utc_timestamp();

	store.append_validation(rep.warnings);
	store.append_run(run);

	return rep;
}

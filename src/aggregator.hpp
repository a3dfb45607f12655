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
	AGGREGATION ORCHESTRATOR

	run_study() folds one study's component estimates into the store:

	  PENDING -> RESOLVING_DISEASE -> UPDATING_STATS -> RECOMPUTING_POOLED -> COMMITTED
	                  (any state) -> FAILED

	Preconditions (study, disease mapping, pair ids, genes, duplicates)
	are checked once before any store work and are never retried.
	UPDATING_STATS and RECOMPUTING_POOLED work on copies and end in a
	single store commit. A transient store error restarts the whole
	update, up to global_opts::max_attempts, sleeping
	backoff_ms * 2^(attempt-1) between attempts.

	The run record and validation records are appended to the store for
	both outcomes.
*/

#ifndef PAIRMETA_AGGREGATOR_HPP
#define PAIRMETA_AGGREGATOR_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "setOptions.hpp"
#include "errors.hpp"
#include "mapID.hpp"
#include "diseaseMap.hpp"
#include "suffStats.hpp"
#include "metaAnalysis.hpp"
#include "statStore.hpp"

enum class run_state { pending, resolving_disease, updating_stats, recomputing_pooled, committed, failed };

std::string state_name(const run_state&);

struct run_report
{
	feature_run run;
	run_state state;
	std::vector<validation_record> warnings;
	int rows_changed;
	int pairs_created;
	int pooled_repaired;

	std::chrono::steady_clock::time_point started;

	bool ok() const { return state == run_state::committed; };
};

class aggregator
{
	public:
		aggregator(stat_store& store_, const gene_reference& genes_, const disease_map& diseases_) :
			store(store_), genes(genes_), diseases(diseases_) {};

		// Returns FAILED reports instead of throwing pairmeta_error. Only a
		// failure to append the run or validation log escapes.
		run_report run_study(const int& study_key, const std::vector<study_component>& components);

	private:
		// A validated component, ready to fold.
		struct staged_contribution
		{
			int gene_a;
			int gene_b;
			const study_component* comp;
			contribution c;
		};

		// A component dropped with a warning; warning indexes rep.warnings.
		struct skipped_contribution
		{
			int gene_a;
			int gene_b;
			const study_component* comp;
			size_t warning;
		};

		stat_store& store;
		const gene_reference& genes;
		const disease_map& diseases;

		static std::atomic<long> run_seq;

		std::string mint_run_id(const int& study_key);
		void transition(run_report& rep, const run_state& s);
		void check_timeout(const run_report& rep, const std::string& where) const;

		std::vector<staged_contribution> check_preconditions(const int& study_key, const std::vector<study_component>& components, run_report& rep, std::vector<skipped_contribution>& skipped);

		// Notes on the warnings where the study's earlier contribution stays in the sums.
		void note_kept_contributions(const int& study_key, const slice_key& slice, const std::vector<skipped_contribution>& skipped, run_report& rep);

		void attempt(const int& study_key, const slice_key& slice, const std::vector<staged_contribution>& staged, run_report& rep);
};

#endif

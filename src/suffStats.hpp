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
	Sufficient statistics for inverse-variance meta-analysis of one
	(pair, disease, technology, metric) key.

	S1 = sum w_i, S2 = sum w_i^2, St = sum w_i theta_i,
	St2 = sum w_i theta_i^2, k = number of studies, with w_i = 1/se_i^2.

	The ledger records every study folded in, with its (w, theta, se, n).
	It is the source of truth: the sums can always be rebuilt by replaying
	it, a re-run of a study first subtracts that study's old entry, and the
	random-effects pass reads se_i from it.
*/

#ifndef PAIRMETA_SUFFSTATS_HPP
#define PAIRMETA_SUFFSTATS_HPP

#include <map>
#include <string>
#include <tuple>

#include "errors.hpp"
#include "setOptions.hpp"

enum class metric_kind { effect, correlation };

std::string kind_name(const metric_kind&);
metric_kind parse_kind(const std::string&);

struct stat_key
{
	long pair_key;
	int disease_key;
	std::string technology;
	std::string metric_name;

	bool operator<(const stat_key& o) const {
		return std::tie(disease_key, technology, pair_key, metric_name) < std::tie(o.disease_key, o.technology, o.pair_key, o.metric_name);
	};
	bool operator==(const stat_key& o) const {
		return pair_key == o.pair_key && disease_key == o.disease_key && technology == o.technology && metric_name == o.metric_name;
	};

	std::string to_string() const;
};

struct ledger_entry
{
	double w;
	double theta;
	double se;
	double n; // NaN when unknown
};

enum class fold_outcome { added, replaced, unchanged };

class suff_stat
{
	public:
		stat_key key;
		metric_kind kind;

		double S1;
		double S2;
		double St;
		double St2;
		int k;

		// Incremented by the store on every committed change; 0 = never stored.
		long version;

		std::map<int, ledger_entry> ledger;

		suff_stat() : kind(metric_kind::effect), S1(0), S2(0), St(0), St2(0), k(0), version(0) {};
		suff_stat(const stat_key& key_, const metric_kind& kind_) :
			key(key_), kind(kind_), S1(0), S2(0), St(0), St2(0), k(0), version(0) {};

		// Adds (or replaces) one study's contribution. se must be finite and > 0.
		fold_outcome fold(const int& study_key, const double& theta, const double& se, const double& n);

		// Subtracts a study's contribution; false if it was not in the ledger.
		bool unfold(const int& study_key);

		// Copy with sums rebuilt from the ledger in study_key order.
		suff_stat replayed() const;

		// Sums and k agree with a ledger replay within rel_tol.
		bool consistent(const double& rel_tol = 1e-9) const;

		// Sum of known sample sizes.
		double n_total() const;

		bool empty() const { return k == 0; };
};

// One per-study estimate for one metric of one pair, as delivered by ingestion.
struct study_component
{
	int study_key;
	std::string pair_id;
	std::string metric_name;
	metric_kind kind;
	double estimate;        // theta, or r for correlations
	double standard_error;  // NaN for correlations
	double n_samples;       // NaN when unknown
	int line_no;
};

// An estimate on the pooling scale (Fisher z for correlations).
struct contribution
{
	double theta;
	double se;
	double n;
};

// Validates a component and converts it to the pooling scale. On a
// data-quality problem returns false and sets code/details.
bool prepare_contribution(const study_component& c, const int& min_corr_n, contribution& out, std::string& code, std::string& details);

#endif

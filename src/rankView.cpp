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

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

#include "rankView.hpp"

rank_query default_rank_query(const slice_key& slice)
{
	rank_query q;
	q.slice = slice;
	q.q_threshold = global_opts::q_threshold;
	q.k_min = global_opts::k_min;
	q.i2_max = global_opts::i2_max;
	q.limit = global_opts::rank_limit;
	return q;
}

int clamp_limit(const int& limit, bool& clamped)
{
	int out = std::min(std::max(limit, global_opts::RANK_LIMIT_MIN), global_opts::RANK_LIMIT_MAX);
	clamped = out != limit;
	return out;
}

std::vector<ranked_pair> score_pairs(const std::vector<pooled_result>& rows)
{
	const double NaN = std::numeric_limits<double>::quiet_NaN();

	// per-metric BH across pairs
	std::map<std::string, std::vector<size_t>> by_metric;
	for( size_t i = 0; i < rows.size(); i++ ){
		by_metric[rows[i].key.metric_name].push_back(i);
	}
	std::vector<double> q_metric(rows.size(), NaN);
	for( const auto& kv : by_metric ){
		std::vector<double> p;
		for( const size_t& i : kv.second ) p.push_back(rows[i].pval);
		std::vector<double> q = p_adjust_bh(p);
		for( size_t j = 0; j < kv.second.size(); j++ ){
			q_metric[kv.second[j]] = q[j];
		}
	}

	std::map<long, std::vector<size_t>> by_pair;
	for( size_t i = 0; i < rows.size(); i++ ){
		by_pair[rows[i].key.pair_key].push_back(i);
	}

	std::vector<ranked_pair> out;
	std::vector<double> p_comb;

	for( const auto& kv : by_pair ){

		ranked_pair rp;
		rp.pair_key = kv.first;
		rp.gene_a = 0;
		rp.gene_b = 0;
		rp.n_metrics = kv.second.size();
		rp.q_star = 1.0;
		rp.i2_star = 100.0;
		rp.included_study_count = std::numeric_limits<int>::max();
		rp.combined_effect_size = NaN;

		std::vector<double> pvals, effects, n;
		double max_n = 0, sum_cons = 0;
		int n_cons = 0;
		double best_p = std::numeric_limits<double>::infinity();
		std::string latest_ts;

		for( const size_t& i : kv.second ){
			const pooled_result& r = rows[i];

			pvals.push_back(r.pval);
			effects.push_back(r.theta_pooled);
			n.push_back(r.n_total);

			if( !std::isnan(q_metric[i]) ){
				rp.q_star = std::min(rp.q_star, q_metric[i]);
			}
			if( !std::isnan(r.I2) ){
				rp.i2_star = std::min(rp.i2_star, r.I2);
			}
			rp.included_study_count = std::min(rp.included_study_count, r.included_study_count);
			if( r.n_total > max_n ) max_n = r.n_total;
			if( !std::isnan(r.sign_consistency) ){
				sum_cons += r.sign_consistency;
				n_cons++;
			}
			if( r.pval < best_p ){
				best_p = r.pval;
				rp.combined_effect_size = r.theta_pooled;
				rp.lead_metric = r.key.metric_name;
			}
			if( r.updated_at >= latest_ts ){
				latest_ts = r.updated_at;
				rp.latest_run_id = r.feature_run_id;
			}
		}

		if( rp.lead_metric == "" ){
			// every p-value was NaN
			rp.combined_effect_size = rows[kv.second[0]].theta_pooled;
			rp.lead_metric = rows[kv.second[0]].key.metric_name;
		}

		stouffer_result st = stouffer(pvals, effects, n);
		rp.p_combined = st.pval;
		rp.composite_score = std::isnan(st.pval) ? 0.0 : -std::log10(clamp_pval(st.pval));
		rp.power_score = std::log10(1.0 + max_n);
		rp.consistency_score = n_cons > 0 ? sum_cons/n_cons : 0.0;

		p_comb.push_back(rp.p_combined);
		out.push_back(rp);
	}

	std::vector<double> q_comb = p_adjust_bh(p_comb);
	for( size_t i = 0; i < out.size(); i++ ){
		out[i].q_combined = q_comb[i];
		if( !std::isnan(q_comb[i]) ){
			out[i].q_star = std::min(out[i].q_star, q_comb[i]);
		}
	}

	return out;
}

bool passes_filter(const ranked_pair& p, const rank_query& q)
{
	return p.included_study_count >= q.k_min && p.q_star <= q.q_threshold && p.i2_star <= q.i2_max;
}

bool rank_before(const ranked_pair& a, const ranked_pair& b)
{
	if( a.q_star != b.q_star ) return a.q_star < b.q_star;
	if( a.composite_score != b.composite_score ) return a.composite_score > b.composite_score;
	if( a.power_score != b.power_score ) return a.power_score > b.power_score;
	if( a.i2_star != b.i2_star ) return a.i2_star < b.i2_star;
	if( a.consistency_score != b.consistency_score ) return a.consistency_score > b.consistency_score;
	double ea = std::fabs(a.combined_effect_size), eb = std::fabs(b.combined_effect_size);
	if( ea != eb ) return ea > eb;
	return a.pair_key < b.pair_key;
}

std::vector<ranked_pair> rank_pairs(const stat_store& store, const gene_reference& genes, const rank_query& q)
{
	std::vector<pooled_result> rows = store.pooled_slice(q.slice);
	gene_pair_index pairs = store.pair_snapshot();

	std::vector<ranked_pair> scored = score_pairs(rows);

	std::vector<ranked_pair> out;
	for( ranked_pair& p : scored ){
		if( passes_filter(p, q) ){
			out.push_back(p);
		}
	}

	std::sort(out.begin(), out.end(), rank_before);

	bool clamped;
	int limit = clamp_limit(q.limit, clamped);
	if( (int) out.size() > limit ){
		out.resize(limit);
	}

	for( ranked_pair& p : out ){
		if( pairs.has_pair(p.pair_key) ){
			const gene_pair& gp = pairs.get(p.pair_key);
			p.gene_a = gp.gene_a;
			p.gene_b = gp.gene_b;
			p.symbol_a = genes.symbol(gp.gene_a);
			p.symbol_b = genes.symbol(gp.gene_b);
		}else{
			p.symbol_a = NA_STRING;
			p.symbol_b = NA_STRING;
		}
	}

	return out;
}

void write_ranked(const std::vector<ranked_pair>& rows, std::ostream& os)
{
	os << "#";
	print_header({
		"rank", "pair_key", "gene_a_key", "gene_b_key", "gene_a_symbol", "gene_b_symbol",
		"n_metrics", "included_study_count", "p_combined", "q_combined", "q_star",
		"i2_star", "composite_score", "power_score", "consistency_score",
		"combined_effect_size", "lead_metric", "latest_run_id"
	}, os);

	int rank = 0;
	for( const ranked_pair& p : rows ){
		rank++;
		os << rank << "\t" << p.pair_key << "\t" << p.gene_a << "\t" << p.gene_b << "\t"
			<< p.symbol_a << "\t" << p.symbol_b << "\t"
			<< p.n_metrics << "\t" << p.included_study_count << "\t"
			<< format_double(p.p_combined) << "\t" << format_double(p.q_combined) << "\t"
			<< format_double(p.q_star) << "\t" << format_double(p.i2_star) << "\t"
			<< format_double(p.composite_score) << "\t" << format_double(p.power_score) << "\t"
			<< format_double(p.consistency_score) << "\t" << format_double(p.combined_effect_size) << "\t"
			<< p.lead_metric << "\t" << p.latest_run_id << "\n";
	}
}

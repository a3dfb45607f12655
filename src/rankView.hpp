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
	Ranking and filtering of gene pairs within one (disease, technology)
	slice, computed from the pooled fact table only.

	FDR values are computed over every pair in the slice before any
	filter is applied, so loosening a filter can only add pairs.
*/

#ifndef PAIRMETA_RANKVIEW_HPP
#define PAIRMETA_RANKVIEW_HPP

#include <iostream>
#include <string>
#include <vector>

#include "setOptions.hpp"
#include "mathStats.hpp"
#include "mapID.hpp"
#include "metaAnalysis.hpp"
#include "statStore.hpp"

struct rank_query
{
	slice_key slice;
	double q_threshold;
	int k_min;
	double i2_max;
	int limit;
};

// Filter thresholds and limit taken from global_opts.
rank_query default_rank_query(const slice_key& slice);

// Bounds limit to [RANK_LIMIT_MIN, RANK_LIMIT_MAX]; sets clamped if it moved.
int clamp_limit(const int& limit, bool& clamped);

struct ranked_pair
{
	long pair_key;
	int gene_a;
	int gene_b;
	std::string symbol_a;
	std::string symbol_b;

	int n_metrics;
	int included_study_count;
	double p_combined;
	double q_combined;
	double q_star;
	double i2_star;
	double composite_score;
	double power_score;
	double consistency_score;
	double combined_effect_size;
	std::string lead_metric;
	std::string latest_run_id;
};

// One entry per pair in rows, with every score filled in; gene fields unset.
std::vector<ranked_pair> score_pairs(const std::vector<pooled_result>& rows);

bool passes_filter(const ranked_pair& p, const rank_query& q);

// Strict weak order used for the ranking; ties end on pair_key.
bool rank_before(const ranked_pair& a, const ranked_pair& b);

std::vector<ranked_pair> rank_pairs(const stat_store& store, const gene_reference& genes, const rank_query& q);

void write_ranked(const std::vector<ranked_pair>& rows, std::ostream& os);

#endif

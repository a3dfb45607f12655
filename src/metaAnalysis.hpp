/*
    Copyright (C) 2020
    Authors: Corbin Quick <qcorbin@hsph.harvard.edu>
	         Li Guan <guanli@umich.edu>

    This file is a part of PAIRMETA.

    PAIRMETA is distributed "AS IS" in the hope that it will be
    useful, but WITHOUT ANY WARRANTY; without even the implied
    warranty of MERCHANTABILITY, NON-INFRINGEMENT, or FITNESS
    FOR A PARTICULAR PURPOSE.

    The above copyright notice and disclaimer of warranty must
    be included in all copies or substantial portions of PAIRMETA.
*/

#ifndef PAIRMETA_METAANALYSIS_HPP
#define PAIRMETA_METAANALYSIS_HPP

#include <optional>
#include <string>
#include <vector>

#include "setOptions.hpp"
#include "suffStats.hpp"
#include "mathStats.hpp"
#include "miscUtils.hpp"

// DerSimonian-Laird random-effects estimate, on the pooling scale.
struct dsl_result
{
	double theta_fixed;
	double theta;
	double se;
	double z;
	double pval;
	double tau2;
	double Q;
	double I2; // NaN when k = 1
	int k;
};

// No result for k = 0.
std::optional<dsl_result> dsl_pool(const suff_stat& ss);

// One row of the pooled fact table. Derived from a suff_stat alone.
struct pooled_result
{
	stat_key key;
	metric_kind kind;

	// r scale for correlations
	double theta_pooled;
	double ci_lower;
	double ci_upper;

	// Fisher z scale for correlations
	double theta_fixed;
	double se_pooled;
	double z;

	double pval;
	double tau2;
	double Q;
	double I2;
	int included_study_count;
	double n_total;
	double sign_consistency;

	std::string feature_run_id;
	std::string updated_at;
};

std::optional<pooled_result> pool_metric(const suff_stat& ss, const std::string& run_id, const std::string& timestamp, const double& ci_level = global_opts::ci_level);

// Compares the statistical fields of two pooled rows (not provenance, not the
// CI bounds, which depend on the confidence level in effect).
bool same_pooled_values(const pooled_result& a, const pooled_result& b, const double& rel_tol);

const std::vector<std::string>& pooled_columns();
std::vector<std::string> pooled_fields(const pooled_result& r);

#endif

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

#include <cmath>
#include <limits>

#include "metaAnalysis.hpp"


std::optional<dsl_result> dsl_pool(const suff_stat& ss)
{
	if( ss.k <= 0 || !(ss.S1 > 0) ){
		return std::nullopt;
	}

	dsl_result out;
	out.k = ss.k;

	double k = ss.k;

	out.theta_fixed = ss.St/ss.S1;

	// Q = sum w (theta - theta_F)^2, clamped against rounding
	out.Q = ss.St2 - ss.St*ss.St/ss.S1;
	if( out.Q < 0 || ss.k == 1 ) out.Q = 0;

	double C = ss.S1 - ss.S2/ss.S1;

	out.tau2 = 0;
	if( ss.k >= 2 && C > 0 ){
		out.tau2 = std::max(0.0, (out.Q - (k - 1.0))/C);
	}

	if( ss.k == 1 ){
		out.I2 = std::numeric_limits<double>::quiet_NaN();
	}else if( out.Q > 0 ){
		out.I2 = std::max(0.0, (out.Q - (k - 1.0))/out.Q) * 100.0;
	}else{
		out.I2 = 0;
	}

	// random-effects second pass over the ledger
	int n = ss.ledger.size();
	Eigen::ArrayXd se2(n), theta(n);
	int i = 0;
	for( const auto& kv : ss.ledger ){
		se2(i) = kv.second.se * kv.second.se;
		theta(i) = kv.second.theta;
		i++;
	}

	if( n > 0 ){
		Eigen::ArrayXd w_re = (se2 + out.tau2).inverse();
		double sw = w_re.sum();
		out.theta = (w_re * theta).sum()/sw;
		out.se = std::sqrt(1.0/sw);
	}else{
		// sums without a ledger; only possible for hand-built rows
		out.theta = out.theta_fixed;
		out.se = std::sqrt(1.0/ss.S1);
	}

	out.z = out.theta/out.se;
	out.pval = two_sided_pval(out.z);

	return out;
}

std::optional<pooled_result> pool_metric(const suff_stat& ss, const std::string& run_id, const std::string& timestamp, const double& ci_level)
{
	std::optional<dsl_result> d = dsl_pool(ss);
	if( !d ){
		return std::nullopt;
	}

	pooled_result out;
	out.key = ss.key;
	out.kind = ss.kind;

	double zc = qnorm((1.0 - ci_level)/2.0, true);
	double lo = d->theta - zc * d->se;
	double hi = d->theta + zc * d->se;

	if( ss.kind == metric_kind::correlation ){
		out.theta_pooled = fisher_z_inv(d->theta);
		out.ci_lower = fisher_z_inv(lo);
		out.ci_upper = fisher_z_inv(hi);
	}else{
		out.theta_pooled = d->theta;
		out.ci_lower = lo;
		out.ci_upper = hi;
	}

	out.theta_fixed = d->theta_fixed;
	out.se_pooled = d->se;
	out.z = d->z;
	out.pval = d->pval;
	out.tau2 = d->tau2;
	out.Q = d->Q;
	out.I2 = d->I2;
	out.included_study_count = d->k;
	out.n_total = ss.n_total();

	int n_agree = 0;
	for( const auto& kv : ss.ledger ){
		if( (kv.second.theta > 0 && d->theta > 0) || (kv.second.theta < 0 && d->theta < 0) || (kv.second.theta == 0 && d->theta == 0) ){
			n_agree++;
		}
	}
	out.sign_consistency = ss.ledger.size() > 0 ? (double) n_agree / ss.ledger.size() : std::numeric_limits<double>::quiet_NaN();

	out.feature_run_id = run_id;
	out.updated_at = timestamp;

	return out;
}

static bool close_or_both_na(const double& a, const double& b, const double& tol)
{
	if( std::isnan(a) || std::isnan(b) ){
		return std::isnan(a) && std::isnan(b);
	}
	return std::fabs(a - b) <= tol * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

bool same_pooled_values(const pooled_result& a, const pooled_result& b, const double& rel_tol)
{
	return a.key == b.key && a.kind == b.kind &&
		a.included_study_count == b.included_study_count &&
		close_or_both_na(a.theta_pooled, b.theta_pooled, rel_tol) &&
		close_or_both_na(a.se_pooled, b.se_pooled, rel_tol) &&
		close_or_both_na(a.theta_fixed, b.theta_fixed, rel_tol) &&
		close_or_both_na(a.tau2, b.tau2, rel_tol) &&
		close_or_both_na(a.Q, b.Q, rel_tol) &&
		close_or_both_na(a.I2, b.I2, rel_tol) &&
		close_or_both_na(a.z, b.z, rel_tol) &&
		close_or_both_na(a.n_total, b.n_total, rel_tol) &&
		close_or_both_na(a.sign_consistency, b.sign_consistency, rel_tol);
}

const std::vector<std::string>& pooled_columns()
{
	static const std::vector<std::string> cols{
		"pair_key", "disease_key", "technology", "metric_name", "kind",
		"theta_pooled", "se_pooled", "ci_lower", "ci_upper", "theta_fixed",
		"tau2", "Q", "I2", "z", "pval", "included_study_count", "n_total",
		"sign_consistency", "feature_run_id", "updated_at"
	};
	return cols;
}

std::vector<std::string> pooled_fields(const pooled_result& r)
{
	return std::vector<std::string>{
		std::to_string(r.key.pair_key),
		std::to_string(r.key.disease_key),
		r.key.technology,
		r.key.metric_name,
		kind_name(r.kind),
		format_double(r.theta_pooled),
		format_double(r.se_pooled),
		format_double(r.ci_lower),
		format_double(r.ci_upper),
		format_double(r.theta_fixed),
		format_double(r.tau2),
		format_double(r.Q),
		format_double(r.I2),
		format_double(r.z),
		format_double(r.pval),
		std::to_string(r.included_study_count),
		format_double(r.n_total),
		format_double(r.sign_consistency),
		r.feature_run_id,
		r.updated_at
	};
}

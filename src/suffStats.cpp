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

#include <cmath>
#include <stdexcept>

#include "suffStats.hpp"
#include "mathStats.hpp"
#include "miscUtils.hpp"

std::string kind_name(const metric_kind& k)
{
	return k == metric_kind::correlation ? "correlation" : "effect";
}

metric_kind parse_kind(const std::string& x)
{
	std::string u = to_upper(trim_string(x));
	if( u == "EFFECT" || u == "THETA" ){
		return metric_kind::effect;
	}
	if( u == "CORRELATION" || u == "R" ){
		return metric_kind::correlation;
	}
	throw precondition_error(err_code::INPUT_FORMAT_INVALID, "unknown metric kind '" + x + "' (valid: effect, correlation)");
}

std::string stat_key::to_string() const
{
	return std::to_string(pair_key) + "/" + std::to_string(disease_key) + "/" + technology + "/" + metric_name;
}

fold_outcome suff_stat::fold(const int& study_key, const double& theta, const double& se, const double& n)
{
	if( !(std::isfinite(se) && se > 0) || !std::isfinite(theta) ){
		throw std::invalid_argument("suff_stat::fold requires finite theta and finite se > 0");
	}

	double w = 1.0/(se*se);
	fold_outcome outcome = fold_outcome::added;

	auto it = ledger.find(study_key);
	if( it != ledger.end() ){
		const ledger_entry& old = it->second;
		bool same_n = (std::isnan(old.n) && std::isnan(n)) || old.n == n;
		if( old.w == w && old.theta == theta && same_n ){
			return fold_outcome::unchanged;
		}
		unfold(study_key);
		outcome = fold_outcome::replaced;
	}

	S1 += w;
	S2 += w*w;
	St += w*theta;
	St2 += w*theta*theta;
	k++;

	ledger_entry e;
	e.w = w;
	e.theta = theta;
	e.se = se;
	e.n = n;
	ledger[study_key] = e;

	return outcome;
}

bool suff_stat::unfold(const int& study_key)
{
	auto it = ledger.find(study_key);
	if( it == ledger.end() ){
		return false;
	}
	const ledger_entry& e = it->second;
	S1 -= e.w;
	S2 -= e.w*e.w;
	St -= e.w*e.theta;
	St2 -= e.w*e.theta*e.theta;
	k--;
	ledger.erase(it);

	// the last study out leaves exact zeros, not rounding residue
	if( k == 0 ){
		S1 = S2 = St = St2 = 0;
	}
	return true;
}

suff_stat suff_stat::replayed() const
{
	suff_stat out(key, kind);
	out.version = version;
	for( const auto& kv : ledger ){
		out.fold(kv.first, kv.second.theta, kv.second.se, kv.second.n);
	}
	return out;
}

static bool rel_close(const double& a, const double& b, const double& tol)
{
	double scale = std::max(std::fabs(a), std::fabs(b));
	return std::fabs(a - b) <= tol * std::max(scale, 1e-12);
}

bool suff_stat::consistent(const double& rel_tol) const
{
	if( k != (int) ledger.size() ){
		return false;
	}
	suff_stat r = replayed();
	// St2 and St can cancel; compare them against the S1-scaled magnitude
	double scale_t = std::max(1.0, std::fabs(r.St2));
	return rel_close(S1, r.S1, rel_tol) &&
		rel_close(S2, r.S2, rel_tol) &&
		std::fabs(St - r.St) <= rel_tol * std::max(scale_t, std::fabs(r.St)) &&
		std::fabs(St2 - r.St2) <= rel_tol * scale_t;
}

double suff_stat::n_total() const
{
	double out = 0;
	for( const auto& kv : ledger ){
		if( kv.second.n > 0 ) out += kv.second.n;
	}
	return out;
}

bool prepare_contribution(const study_component& c, const int& min_corr_n, contribution& out, std::string& code, std::string& details)
{
	out.n = c.n_samples;

	if( c.kind == metric_kind::correlation ){
		int n_floor = std::max(min_corr_n, global_opts::CORRELATION_N_FLOOR);
		if( !std::isfinite(c.estimate) || std::fabs(c.estimate) >= 1.0 ){
			code = err_code::CORRELATION_OUT_OF_RANGE;
			details = "correlation " + format_double(c.estimate) + " is outside (-1, 1)";
			return false;
		}
		if( !(c.n_samples >= n_floor) ){
			code = err_code::CORRELATION_N_TOO_SMALL;
			details = "correlation sample size " + format_double(c.n_samples) + " < " + std::to_string(n_floor);
			return false;
		}
		out.theta = fisher_z(c.estimate);
		out.se = fisher_z_se(c.n_samples);
		return true;
	}

	if( !std::isfinite(c.estimate) ){
		code = err_code::NON_FINITE_ESTIMATE;
		details = "effect estimate is not finite";
		return false;
	}
	if( !(std::isfinite(c.standard_error) && c.standard_error > 0) ){
		code = err_code::NON_POSITIVE_SE;
		details = "standard error " + format_double(c.standard_error) + " is not finite and > 0";
		return false;
	}
	out.theta = c.estimate;
	out.se = c.standard_error;
	return true;
}

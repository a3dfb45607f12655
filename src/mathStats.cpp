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
#include <stdexcept>

#include "mathStats.hpp"


double p_bd = 1e-300;

double qnorm(double p, bool lower){
	boost::math::normal N01(0.0, 1.0);
	if( lower ) return boost::math::quantile(boost::math::complement(N01, p));
	return boost::math::quantile(N01, p);
}

double pnorm(double x, bool lower){
	boost::math::normal N01(0.0, 1.0);
	if( lower ) return boost::math::cdf(boost::math::complement(N01, x));
	return boost::math::cdf(N01, x);
}

double clamp_pval(double p){
	p = p > p_bd ? p : p_bd;
	p = p < 1.0 ? p : 1.0;
	return p;
}

double two_sided_pval(double z){
	if( std::isnan(z) ){
		return std::numeric_limits<double>::quiet_NaN();
	}
	if( std::isinf(z) ){
		return 0.0;
	}
	double p = 2.0 * pnorm(std::fabs(z), true);
	return p < 1.0 ? p : 1.0;
}

double signed_z_from_pval(double p, double effect){
	p = clamp_pval(p);
	// Phi^-1(1 - p/2), taken on the upper tail to keep precision for small p
	double z = qnorm(p/2.0, true);
	if( effect < 0 ){
		return -z;
	}
	return z;
}

double fisher_z(double r){
	return std::atanh(r);
}

double fisher_z_inv(double z){
	return std::tanh(z);
}

double fisher_z_se(double n){
	return 1.0/std::sqrt(n - 3.0);
}

stouffer_result stouffer(const std::vector<double>& pvals, const std::vector<double>& effects, const std::vector<double>& n, stouffer_weight_mode mode, missing_n_mode missing){

	if( pvals.size() != effects.size() || ( n.size() > 0 && n.size() != pvals.size() ) ){
		throw std::invalid_argument("stouffer: pvals, effects and n must have equal length");
	}

	stouffer_result out;
	out.n_used = 0;
	out.equal_weights = (mode == stouffer_weight_mode::equal) || n.size() == 0;

	if( !out.equal_weights && missing == missing_n_mode::equal_all ){
		for( const double& n_i : n ){
			if( !(n_i > 0) ){
				out.equal_weights = true;
				break;
			}
		}
	}

	double num = 0.0, den = 0.0;
	for( size_t i = 0; i < pvals.size(); i++ ){
		if( std::isnan(pvals[i]) ){
			continue;
		}
		double w = 1.0;
		if( !out.equal_weights && n[i] > 0 ){
			w = std::sqrt(n[i]);
		}
		num += w * signed_z_from_pval(pvals[i], effects[i]);
		den += w * w;
		out.n_used++;
	}

	if( out.n_used == 0 || den <= 0 ){
		out.Z = std::numeric_limits<double>::quiet_NaN();
		out.pval = std::numeric_limits<double>::quiet_NaN();
		return out;
	}

	out.Z = num/std::sqrt(den);
	out.pval = two_sided_pval(out.Z);
	return out;
}

stouffer_result stouffer(const std::vector<double>& pvals, const std::vector<double>& effects, const std::vector<double>& n){
	return stouffer(pvals, effects, n, global_opts::stouffer_weighting, global_opts::stouffer_missing_n);
}

std::vector<double> p_adjust_bh(const std::vector<double>& pvals){

	std::vector<size_t> idx;
	for( size_t i = 0; i < pvals.size(); i++ ){
		if( !std::isnan(pvals[i]) ) idx.push_back(i);
	}

	std::vector<double> out(pvals.size(), std::numeric_limits<double>::quiet_NaN());
	const size_t m = idx.size();
	if( m == 0 ){
		return out;
	}

	std::stable_sort(idx.begin(), idx.end(),
		[&pvals](size_t i, size_t j){ return pvals[i] < pvals[j]; });

	// q_(i) = min_{j >= i} p_(j) * m / j, walking down from the largest p
	Eigen::ArrayXd q(m);
	double running = 1.0;
	for( size_t r = m; r-- > 0; ){
		double val = pvals[idx[r]] * static_cast<double>(m) / static_cast<double>(r + 1);
		running = std::min(running, val);
		q(r) = running;
	}
	q = q.min(1.0);

	for( size_t r = 0; r < m; r++ ){
		out[idx[r]] = q(r);
	}
	return out;
}

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


#ifndef PAIRMETA_MATHSTATS_HPP
#define PAIRMETA_MATHSTATS_HPP

#include <vector>
#include <numeric>

#include "setOptions.hpp"

#include <boost/math/distributions/normal.hpp>

#include <Eigen/Dense>

// ------------------------------------
//  R-like normal pdf and cdf
//  (lower = true returns the upper-tail complement)
// ------------------------------------
double qnorm(double, bool lower = false);
double pnorm(double, bool lower = false);

// Two-sided normal p-value, 2*(1 - Phi(|z|)), computed on the upper tail.
double two_sided_pval(double z);

// Signed z-score for a two-sided p-value: Phi^-1(1 - p/2) * sign(effect).
double signed_z_from_pval(double p, double effect);

// ------------------------------------
//  Fisher z-transform
// ------------------------------------
double fisher_z(double r);
double fisher_z_inv(double z);
double fisher_z_se(double n);

// ------------------------------------
//  Stouffer's weighted Z
// ------------------------------------
struct stouffer_result
{
	double Z;
	double pval;
	int n_used;
	bool equal_weights;
};

// n entries may be NaN (unknown sample size). effects only contribute a sign.
stouffer_result stouffer(const std::vector<double>& pvals, const std::vector<double>& effects, const std::vector<double>& n, stouffer_weight_mode mode, missing_n_mode missing);

// Uses the process-wide global_opts weighting.
stouffer_result stouffer(const std::vector<double>& pvals, const std::vector<double>& effects, const std::vector<double>& n);

// ------------------------------------
//  Multiple testing
// ------------------------------------

// Benjamini-Hochberg step-up adjustment; NaN p-values stay NaN and are not counted.
std::vector<double> p_adjust_bh(const std::vector<double>& pvals);

double clamp_pval(double p);

#endif

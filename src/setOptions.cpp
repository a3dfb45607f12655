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


/* setOptions is for setting global options, which are set at
 runtime and used throughout (potentially) all source files*/

#include <stdexcept>

#include "setOptions.hpp"

namespace global_opts
{

	// GENERAL OPTIONS
		std::string store_dir = "";
		int n_threads = 1;

	// RANKING OPTIONS
		double q_threshold = 0.05;
		int k_min = 3;
		double i2_max = 75.0;
		int rank_limit = 100;

	// POOLING OPTIONS
		int min_correlation_n = 4;
		double ci_level = 0.95;

	// STOUFFER OPTIONS
		stouffer_weight_mode stouffer_weighting = stouffer_weight_mode::sqrt_n;
		missing_n_mode stouffer_missing_n = missing_n_mode::equal_all;

	// RUN CONTROL OPTIONS
		int max_attempts = 3;
		int backoff_ms = 100;
		double run_timeout_sec = 0;

	// CONSTANTS
		const int RANK_LIMIT_MIN = 1;
		const int RANK_LIMIT_MAX = 1000;
		const int CORRELATION_N_FLOOR = 4;
}

bool global_opts::process_global_opts(const std::string& store, const double& q, const int& kmin, const double& i2, const int& min_corr_n, const double& ci){
	if( !(q > 0 && q <= 1) ){
		throw std::invalid_argument("q threshold must be in (0, 1], got " + std::to_string(q));
	}
	if( kmin < 1 ){
		throw std::invalid_argument("k_min must be >= 1, got " + std::to_string(kmin));
	}
	if( !(i2 >= 0 && i2 <= 100) ){
		throw std::invalid_argument("i2_max must be in [0, 100], got " + std::to_string(i2));
	}
	if( min_corr_n < CORRELATION_N_FLOOR ){
		throw std::invalid_argument("min_correlation_n must be >= " + std::to_string(CORRELATION_N_FLOOR) + ", got " + std::to_string(min_corr_n));
	}
	if( !(ci > 0 && ci < 1) ){
		throw std::invalid_argument("confidence level must be in (0, 1), got " + std::to_string(ci));
	}
	store_dir = store;
	q_threshold = q;
	k_min = kmin;
	i2_max = i2;
	min_correlation_n = min_corr_n;
	ci_level = ci;
	return true;
}

bool global_opts::set_stouffer_options(const std::string& weighting, const std::string& missing_n){
	if( weighting == "sqrt_n" ){
		stouffer_weighting = stouffer_weight_mode::sqrt_n;
	}else if( weighting == "equal" ){
		stouffer_weighting = stouffer_weight_mode::equal;
	}else{
		throw std::invalid_argument("unknown Stouffer weighting '" + weighting + "' (valid: sqrt_n, equal)");
	}
	if( missing_n == "equal_all" ){
		stouffer_missing_n = missing_n_mode::equal_all;
	}else if( missing_n == "unit" ){
		stouffer_missing_n = missing_n_mode::unit;
	}else{
		throw std::invalid_argument("unknown missing-n policy '" + missing_n + "' (valid: equal_all, unit)");
	}
	return true;
}

bool global_opts::set_run_options(const int& attempts, const int& backoff, const double& timeout){
	if( attempts < 1 ){
		throw std::invalid_argument("max attempts must be >= 1");
	}
	if( backoff < 0 ){
		throw std::invalid_argument("backoff must be >= 0 ms");
	}
	if( timeout < 0 ){
		throw std::invalid_argument("timeout must be >= 0 s");
	}
	max_attempts = attempts;
	backoff_ms = backoff;
	run_timeout_sec = timeout;
	return true;
}

void global_opts::set_threads(const int& nt){
	n_threads = nt >= 1 ? nt : 1;
	return;
}

void global_opts::reset(){
	store_dir = "";
	n_threads = 1;
	q_threshold = 0.05;
	k_min = 3;
	i2_max = 75.0;
	rank_limit = 100;
	min_correlation_n = 4;
	ci_level = 0.95;
	stouffer_weighting = stouffer_weight_mode::sqrt_n;
	stouffer_missing_n = missing_n_mode::equal_all;
	max_attempts = 3;
	backoff_ms = 100;
	run_timeout_sec = 0;
	return;
}

std::string global_opts::stouffer_weighting_name(){
	return stouffer_weighting == stouffer_weight_mode::sqrt_n ? "sqrt_n" : "equal";
}

std::string global_opts::stouffer_missing_n_name(){
	return stouffer_missing_n == missing_n_mode::equal_all ? "equal_all" : "unit";
}

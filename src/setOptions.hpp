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
setOptions is for setting global options, which are set at
runtime and used throughout multiple source files
*/

#ifndef PAIRMETA_SETOPTIONS_HPP
#define PAIRMETA_SETOPTIONS_HPP

#include <iostream>
#include <string>
#include <vector>

enum class stouffer_weight_mode { sqrt_n, equal };

// How sqrt_n weighting treats studies without a known sample size.
//   equal_all: any unknown n switches the whole combination to equal weights.
//   unit:      unknown n gets weight 1, known n keeps sqrt(n).
enum class missing_n_mode { equal_all, unit };

namespace global_opts
{
	// GENERAL OPTIONS
		extern std::string store_dir;
		extern int n_threads;

	// RANKING OPTIONS
		extern double q_threshold;
		extern int k_min;
		extern double i2_max;
		extern int rank_limit;

	// POOLING OPTIONS
		extern int min_correlation_n;
		extern double ci_level;

	// STOUFFER OPTIONS
		extern stouffer_weight_mode stouffer_weighting;
		extern missing_n_mode stouffer_missing_n;

	// RUN CONTROL OPTIONS
		extern int max_attempts;
		extern int backoff_ms;
		extern double run_timeout_sec;

	// CONSTANTS
		extern const int RANK_LIMIT_MIN;
		extern const int RANK_LIMIT_MAX;
		extern const int CORRELATION_N_FLOOR;

	// PROCESS OPTIONS

		bool process_global_opts(const std::string& store, const double& q, const int& kmin, const double& i2, const int& min_corr_n, const double& ci);

		bool set_stouffer_options(const std::string& weighting, const std::string& missing_n);

		bool set_run_options(const int& attempts, const int& backoff, const double& timeout);

		void set_threads(const int& nt);

		void reset();

		std::string stouffer_weighting_name();
		std::string stouffer_missing_n_name();
}

# endif

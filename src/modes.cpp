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
#include <fstream>
#include <map>
#include <set>

#include "cli.hpp"


int parseModeArgs(args::ArgumentParser& p, std::vector<std::string>::const_iterator& args_begin, std::vector<std::string>::const_iterator& args_end){

	try
	{
		p.ParseArgs(args_begin, args_end);
	}
	catch (const args::Completion& e)
	{
		std::cout << e.what();
		return 0;
	}
	catch (args::Help)
	{
		restore_cursor();
		std::cout << p;
		exit(0);
	}
	catch (args::ParseError e)
	{
		restore_cursor();
		std::cerr << e.what() << "\n";
		std::cerr << p;
		exit(1);
	}
	catch (args::ValidationError e)
	{
		restore_cursor();
		std::cerr << e.what() << "\n";
		std::cerr << p;
		exit(1);
	}
	return 0;
}

static void apply_threads(const int& nthreads){
	global_opts::set_threads(nthreads);
#if defined(_OPENMP)
	omp_set_num_threads(global_opts::n_threads);
#endif
	Eigen::setNbThreads(global_opts::n_threads);
	std::cerr << "Using " << global_opts::n_threads << " threads.\n";
}

static std::vector<double> parse_double_list(const std::string& x, const std::string& name){
	std::vector<double> out;
	for( const std::string& s : split_string(x, ',') ){
		std::string t = trim_string(s);
		if( t == NA_STRING ){
			out.push_back(parse_double_na(t));
			continue;
		}
		double v;
		if( !parse_double(t, v) ){
			throw std::invalid_argument("invalid value '" + s + "' in --" + name);
		}
		out.push_back(v);
	}
	return out;
}

static std::vector<int> parse_study_list(const std::string& x){
	std::vector<int> out;
	for( const std::string& s : split_string(x, ',') ){
		int v;
		if( !parse_int(trim_string(s), v) ){
			throw std::invalid_argument("invalid study key '" + s + "' in --study");
		}
		if( has_element(out, v) ){
			throw std::invalid_argument("study key " + s + " listed twice in --study");
		}
		out.push_back(v);
	}
	return out;
}

static int resolve_disease_arg(const std::string& x, const std::string& diseases_file){
	if( diseases_file != "" ){
		disease_map dm;
		read_diseases(diseases_file, dm);
		return dm.lookup_disease(x);
	}
	int key;
	if( !parse_int(x, key) ){
		throw std::invalid_argument("--disease '" + x + "' is not a disease key; give --diseases to look up labels");
	}
	return key;
}


int update(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs){

	args::ArgumentParser p("pairmeta update: Fold study component estimates into the pooled store.", "");
	args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
	args::CompletionFlag completion(p, {"complete"});

	p.Prog(progname);

	args::Group inp_args(p, "Input and output file paths");
		args::ValueFlag<std::string> store_arg(inp_args, "", "Store directory (created if absent).", {"store"});
		args::ValueFlag<std::string> genes_arg(inp_args, "", "Gene reference table.", {"genes"});
		args::ValueFlag<std::string> diseases_arg(inp_args, "", "Disease reference table.", {"diseases"});
		args::ValueFlag<std::string> studies_arg(inp_args, "", "Study reference table.", {"studies"});
		args::ValueFlag<std::string> mappings_arg(inp_args, "", "Study to disease mapping table.", {"mappings"});
		args::ValueFlag<std::string> components_arg(inp_args, "", "Per-study component estimates.", {"components"});
		args::ValueFlag<std::string> study_arg(inp_args, "", "Triggering study key (or comma-separated list, processed in order).", {"study"});

	args::Group pool_args(p, "Pooling options");
		args::ValueFlag<int> min_corr_n_arg(pool_args, "4", "Minimum sample size for correlation metrics (at least 4).", {"min-corr-n"}, 4);
		args::ValueFlag<double> ci_arg(pool_args, "0.95", "Confidence level for pooled intervals.", {"ci-level"}, 0.95);

	args::Group run_args(p, "Run control options");
		args::ValueFlag<int> attempts_arg(run_args, "3", "Maximum attempts per study on transient store errors.", {"max-attempts"}, 3);
		args::ValueFlag<int> backoff_arg(run_args, "100", "Initial retry backoff in milliseconds (doubles per attempt).", {"backoff-ms"}, 100);
		args::ValueFlag<double> timeout_arg(run_args, "0", "Per-study run timeout in seconds (0 = none).", {"timeout"}, 0);

	args::Group opt_args(p, "General options");
		args::ValueFlag<int> threads_arg(opt_args, "1", "No. threads (not to exceed no. available cores).", {"threads"}, 1);

	parseModeArgs(p, beginargs, endargs);

	try{
		std::string store_dir = args::get(store_arg);
		if( store_dir == "" || !genes_arg || !diseases_arg || !studies_arg || !mappings_arg || !components_arg || !study_arg ){
			std::cerr << "Error: --store, --genes, --diseases, --studies, --mappings, --components and --study are required.\n";
			std::cerr << p;
			return 1;
		}

		global_opts::process_global_opts(store_dir, global_opts::q_threshold, global_opts::k_min, global_opts::i2_max, args::get(min_corr_n_arg), args::get(ci_arg));
		global_opts::set_run_options(args::get(attempts_arg), args::get(backoff_arg), args::get(timeout_arg));
		apply_threads(args::get(threads_arg));

		std::vector<int> study_keys = parse_study_list(args::get(study_arg));

		gene_reference genes = read_genes(args::get(genes_arg));
		disease_map dm = read_disease_map(args::get(diseases_arg), args::get(studies_arg), args::get(mappings_arg));
		std::vector<study_component> components = read_components(args::get(components_arg));

		// each run gets its own study's rows plus any rows of unlisted
		// studies, which fail it as foreign components
		std::map<int, std::vector<study_component>> by_study;
		std::vector<study_component> unlisted;
		for( const study_component& c : components ){
			if( has_element(study_keys, c.study_key) ){
				by_study[c.study_key].push_back(c);
			}else{
				unlisted.push_back(c);
			}
		}

		file_store store(store_dir);
		aggregator agg(store, genes, dm);

		print_header({"#feature_run_id", "study_key", "state", "records_applied", "records_rejected", "rows_changed", "error_code"}, std::cout);

		int n_failed = 0;
		for( const int& s : study_keys ){
			std::vector<study_component> rows = by_study[s];
			rows.insert(rows.end(), unlisted.begin(), unlisted.end());

			run_report rep = agg.run_study(s, rows);
			std::cout << rep.run.feature_run_id << "\t" << s << "\t" << state_name(rep.state) << "\t"
				<< rep.run.records_applied << "\t" << rep.run.records_rejected << "\t"
				<< rep.rows_changed << "\t" << (rep.ok() ? NA_STRING : rep.run.error_code) << "\n";
			if( !rep.ok() ) n_failed++;
		}

		if( n_failed > 0 ){
			std::cerr << "Error: " << n_failed << " of " << study_keys.size() << " study runs failed.\n";
			return 1;
		}
	}catch( const pairmeta_error& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}catch( const std::invalid_argument& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}


int top(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs){

	args::ArgumentParser p("pairmeta top: Ranked gene pairs for one disease and technology.", "");
	args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
	args::CompletionFlag completion(p, {"complete"});

	p.Prog(progname);

	args::Group inp_args(p, "Input and output file paths");
		args::ValueFlag<std::string> store_arg(inp_args, "", "Store directory.", {"store"});
		args::ValueFlag<std::string> genes_arg(inp_args, "", "Gene reference table (for gene symbols).", {"genes"});
		args::ValueFlag<std::string> diseases_arg(inp_args, "", "Disease reference table (to look up --disease by label).", {"diseases"});
		args::ValueFlag<std::string> out_arg(inp_args, "", "Output file (default: stdout).", {'o', "out"});

	args::Group slice_args(p, "Slice");
		args::ValueFlag<std::string> disease_arg(slice_args, "", "Disease label or key.", {"disease"});
		args::ValueFlag<std::string> tech_arg(slice_args, "", "Technology (RNA-SEQ, MICROARRAY, OTHER).", {"technology"});

	args::Group filter_args(p, "Filtering and ranking options");
		args::ValueFlag<double> q_arg(filter_args, "0.05", "Maximum FDR q-value.", {"q"}, 0.05);
		args::ValueFlag<int> kmin_arg(filter_args, "3", "Minimum number of included studies.", {"k-min"}, 3);
		args::ValueFlag<double> i2_arg(filter_args, "75", "Maximum I2 heterogeneity (percent).", {"i2-max"}, 75.0);
		args::ValueFlag<int> limit_arg(filter_args, "100", "Maximum rows returned (1 to 1000).", {"limit"}, 100);
		args::ValueFlag<std::string> weighting_arg(filter_args, "sqrt_n", "Stouffer weighting (sqrt_n or equal).", {"stouffer-weighting"}, "sqrt_n");
		args::ValueFlag<std::string> missing_n_arg(filter_args, "equal_all", "Stouffer weights when n is unknown (equal_all or unit).", {"stouffer-missing-n"}, "equal_all");

	parseModeArgs(p, beginargs, endargs);

	try{
		std::string store_dir = args::get(store_arg);
		if( store_dir == "" || !disease_arg || !tech_arg ){
			std::cerr << "Error: --store, --disease and --technology are required.\n";
			std::cerr << p;
			return 1;
		}

		global_opts::process_global_opts(store_dir, args::get(q_arg), args::get(kmin_arg), args::get(i2_arg), global_opts::min_correlation_n, global_opts::ci_level);
		global_opts::set_stouffer_options(args::get(weighting_arg), args::get(missing_n_arg));

		bool clamped;
		global_opts::rank_limit = clamp_limit(args::get(limit_arg), clamped);
		if( clamped ){
			std::cerr << "Warning: --limit " << args::get(limit_arg) << " is outside [" << global_opts::RANK_LIMIT_MIN << ", " << global_opts::RANK_LIMIT_MAX << "]; using " << global_opts::rank_limit << ".\n";
		}

		gene_reference genes;
		if( genes_arg ){
			genes = read_genes(args::get(genes_arg));
		}

		slice_key slice;
		slice.disease_key = resolve_disease_arg(args::get(disease_arg), args::get(diseases_arg));
		slice.technology = normalize_technology(args::get(tech_arg));

		if( !file_exists(store_dir) ){
			throw transient_store_error(err_code::STORE_UNAVAILABLE, "store directory " + store_dir + " does not exist");
		}
		file_store store(store_dir);

		std::vector<ranked_pair> rows = rank_pairs(store, genes, default_rank_query(slice));
		std::cerr << rows.size() << " pairs pass filters in slice " << slice.to_string() << ".\n";

		std::string out_file = args::get(out_arg);
		if( out_file == "" ){
			write_ranked(rows, std::cout);
		}else{
			std::ofstream os(out_file);
			if( !os ){
				throw std::invalid_argument("cannot write to " + out_file);
			}
			write_ranked(rows, os);
		}
	}catch( const pairmeta_error& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}catch( const std::invalid_argument& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}


int review(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs){

	args::ArgumentParser p("pairmeta review: Record a review verdict for a gene pair.", "");
	args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
	args::CompletionFlag completion(p, {"complete"});

	p.Prog(progname);

	args::Group review_args(p, "Review");
		args::ValueFlag<std::string> store_arg(review_args, "", "Store directory.", {"store"});
		args::ValueFlag<long> pair_arg(review_args, "", "Pair key.", {"pair"});
		args::ValueFlag<std::string> run_arg(review_args, "", "Feature run id the verdict refers to.", {"run"});
		args::ValueFlag<std::string> reviewer_arg(review_args, "", "Reviewer name.", {"reviewer"});
		args::ValueFlag<std::string> verdict_arg(review_args, "", "Verdict text.", {"verdict"});
		args::ValueFlag<std::string> note_arg(review_args, "", "Free-text note.", {"note"});

	parseModeArgs(p, beginargs, endargs);

	try{
		std::string store_dir = args::get(store_arg);
		if( store_dir == "" || !pair_arg || !run_arg || !reviewer_arg || !verdict_arg ){
			std::cerr << "Error: --store, --pair, --run, --reviewer and --verdict are required.\n";
			std::cerr << p;
			return 1;
		}
		if( !file_exists(store_dir) ){
			throw transient_store_error(err_code::STORE_UNAVAILABLE, "store directory " + store_dir + " does not exist");
		}
		file_store store(store_dir);

		review_verdict r;
		r.pair_key = args::get(pair_arg);
		r.feature_run_id = args::get(run_arg);
		r.reviewer = args::get(reviewer_arg);
		r.verdict = args::get(verdict_arg);
		r.note = args::get(note_arg);
		r.created_at = utc_timestamp();

		bool known_run = false;
		for( const feature_run& fr : store.runs() ){
			if( fr.feature_run_id == r.feature_run_id ){
				known_run = true;
				break;
			}
		}
		if( !known_run ){
			std::cerr << "Warning: run " << r.feature_run_id << " is not in the run log.\n";
		}

		store.append_review(r);
		std::cerr << "Recorded verdict '" << r.verdict << "' for pair " << r.pair_key << ".\n";
	}catch( const pairmeta_error& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}


int combine(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs){

	args::ArgumentParser p("pairmeta combine: Stouffer combination of two-sided p-values.", "");
	args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
	args::CompletionFlag completion(p, {"complete"});

	p.Prog(progname);

	args::Group comb_args(p, "Inputs");
		args::ValueFlag<std::string> pvals_arg(comb_args, "", "Two-sided p-values (comma-separated).", {"pvals"});
		args::ValueFlag<std::string> effects_arg(comb_args, "", "Effect estimates giving each p-value's sign (comma-separated).", {"effects"});
		args::ValueFlag<std::string> n_arg(comb_args, "", "Sample sizes (comma-separated, NA for unknown).", {"n"});

	args::Group opt_args(p, "Options");
		args::ValueFlag<std::string> weighting_arg(opt_args, "sqrt_n", "Weighting (sqrt_n or equal).", {"stouffer-weighting"}, "sqrt_n");
		args::ValueFlag<std::string> missing_n_arg(opt_args, "equal_all", "Weights when n is unknown (equal_all or unit).", {"stouffer-missing-n"}, "equal_all");

	parseModeArgs(p, beginargs, endargs);

	try{
		if( !pvals_arg || !effects_arg ){
			std::cerr << "Error: --pvals and --effects are required.\n";
			std::cerr << p;
			return 1;
		}
		global_opts::set_stouffer_options(args::get(weighting_arg), args::get(missing_n_arg));

		std::vector<double> pvals = parse_double_list(args::get(pvals_arg), "pvals");
		std::vector<double> effects = parse_double_list(args::get(effects_arg), "effects");
		std::vector<double> n;
		if( n_arg ){
			n = parse_double_list(args::get(n_arg), "n");
		}

		for( const double& pv : pvals ){
			if( !std::isnan(pv) && !(pv >= 0 && pv <= 1) ){
				throw std::invalid_argument("p-values must be in [0, 1]");
			}
		}

		stouffer_result st = stouffer(pvals, effects, n);

		print_header({"Z", "pval", "n_used", "weighting"}, std::cout);
		std::cout << format_double(st.Z) << "\t" << format_double(st.pval) << "\t" << st.n_used << "\t"
			<< (st.equal_weights ? "equal" : "sqrt_n") << "\n";
	}catch( const std::invalid_argument& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}


int verify(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs){

	args::ArgumentParser p("pairmeta verify: Replay contribution ledgers and check the store.", "");
	args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
	args::CompletionFlag completion(p, {"complete"});

	p.Prog(progname);

	args::Group inp_args(p, "Store");
		args::ValueFlag<std::string> store_arg(inp_args, "", "Store directory.", {"store"});
		args::ValueFlag<double> tol_arg(inp_args, "1e-9", "Relative tolerance for ledger replay.", {"tolerance"}, 1e-9);

	parseModeArgs(p, beginargs, endargs);

	try{
		std::string store_dir = args::get(store_arg);
		if( store_dir == "" ){
			std::cerr << "Error: --store is required.\n";
			std::cerr << p;
			return 1;
		}
		if( !file_exists(store_dir) ){
			throw transient_store_error(err_code::STORE_UNAVAILABLE, "store directory " + store_dir + " does not exist");
		}
		file_store store(store_dir);

		int n_bad = verify_store(store, args::get(tol_arg), std::cout);
		if( n_bad > 0 ){
			std::cerr << "Error: " << n_bad << " mismatching rows.\n";
			return 1;
		}
		std::cerr << "All rows consistent.\n";
	}catch( const pairmeta_error& e ){
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}

	return 0;
}

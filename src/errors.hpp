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
	Error taxonomy for the aggregation engine.

	precondition_error     fatal for the run, never retried.
	transient_store_error  retried by the aggregator with backoff.
	run_failure            terminal outcome of the retry/timeout logic.

	Data-quality problems are not exceptions; they are recorded as
	validation records and the offending contribution is skipped.
*/

#ifndef PAIRMETA_ERRORS_HPP
#define PAIRMETA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace err_code
{
	// precondition failures
	constexpr const char* MISSING_DISEASE_MAPPING = "MissingDiseaseMapping";
	constexpr const char* MULTI_DISEASE_MAPPING   = "MultiDiseaseMapping";
	constexpr const char* INACTIVE_DISEASE        = "InactiveDisease";
	constexpr const char* UNKNOWN_STUDY           = "UnknownStudy";
	constexpr const char* PAIR_GENE_KEY_NOT_FOUND = "PairGeneKeyNotFound";
	constexpr const char* PAIR_ID_FORMAT_INVALID  = "PairIdFormatInvalid";
	constexpr const char* DUPLICATE_COMPONENT     = "DuplicateComponent";
	constexpr const char* METRIC_KIND_MISMATCH    = "MetricKindMismatch";
	constexpr const char* FOREIGN_STUDY_COMPONENT = "ForeignStudyComponent";
	constexpr const char* INPUT_FORMAT_INVALID    = "InputFormatInvalid";

	// transient store failures
	constexpr const char* STORE_CONFLICT          = "StoreConflict";
	constexpr const char* STORE_UNAVAILABLE       = "StoreUnavailable";

	// run outcomes
	constexpr const char* RETRIES_EXHAUSTED       = "RetriesExhausted";
	constexpr const char* RUN_TIMEOUT             = "RunTimeout";
	constexpr const char* INTERNAL_ERROR          = "InternalError";

	// data-quality warnings (validation records)
	constexpr const char* NON_POSITIVE_SE          = "NON_POSITIVE_SE";
	constexpr const char* NON_FINITE_ESTIMATE      = "NON_FINITE_ESTIMATE";
	constexpr const char* CORRELATION_N_TOO_SMALL  = "CORRELATION_N_TOO_SMALL";
	constexpr const char* CORRELATION_OUT_OF_RANGE = "CORRELATION_OUT_OF_RANGE";
}

struct error_context
{
	std::string study_key;
	std::string pair_id;
	std::string metric_name;

	error_context() {};
	error_context(const std::string& s, const std::string& p = "", const std::string& m = "") :
		study_key(s), pair_id(p), metric_name(m) {};

	std::string to_string() const;
};

class pairmeta_error : public std::runtime_error
{
	public:
		pairmeta_error(const std::string& code, const std::string& msg, const error_context& ctx = error_context());

		const std::string& code() const { return err_code_; };
		const std::string& detail() const { return detail_; };
		const error_context& context() const { return ctx_; };

	private:
		std::string err_code_;
		std::string detail_;
		error_context ctx_;
};

class precondition_error : public pairmeta_error
{
	public:
		using pairmeta_error::pairmeta_error;
};

class transient_store_error : public pairmeta_error
{
	public:
		using pairmeta_error::pairmeta_error;
};

class run_failure : public pairmeta_error
{
	public:
		using pairmeta_error::pairmeta_error;
};

#endif

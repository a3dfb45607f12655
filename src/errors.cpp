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

#include "errors.hpp"

std::string error_context::to_string() const
{
	std::string out;
	if( study_key != "" ){
		out += "study_key=" + study_key;
	}
	if( pair_id != "" ){
		if( out != "" ) out += ", ";
		out += "pair_id=" + pair_id;
	}
	if( metric_name != "" ){
		if( out != "" ) out += ", ";
		out += "metric_name=" + metric_name;
	}
	return out;
}

static std::string format_error(const std::string& code, const std::string& msg, const error_context& ctx)
{
	std::string ctx_s = ctx.to_string();
	if( ctx_s == "" ){
		return code + ": " + msg;
	}
	return code + ": " + msg + " (" + ctx_s + ")";
}

pairmeta_error::pairmeta_error(const std::string& code, const std::string& msg, const error_context& ctx) :
	std::runtime_error(format_error(code, msg, ctx)), err_code_(code), detail_(msg), ctx_(ctx)
{}

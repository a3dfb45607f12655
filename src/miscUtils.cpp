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

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <ctime>
#include <limits>

#include "miscUtils.hpp"


std::vector<std::string> split_string(const std::string& input, const char delim)
{
	std::stringstream ss(input);
	std::string field;
	std::vector<std::string> out;

	while( getline(ss, field, delim) ){
		out.push_back(field);
	}
	return out;
}

std::string trim_string(const std::string& x)
{
	size_t first = x.find_first_not_of(" \t\r\n");
	if( first == std::string::npos ){
		return "";
	}
	size_t last = x.find_last_not_of(" \t\r\n");
	return x.substr(first, last - first + 1);
}

std::string to_upper(std::string x)
{
	for( char& c : x ){
		c = toupper(static_cast<unsigned char>(c));
	}
	return x;
}

bool parse_long(const std::string& x, long& out)
{
	if( x.empty() || isspace(static_cast<unsigned char>(x[0])) ){
		return false;
	}
	char* end = nullptr;
	errno = 0;
	long v = strtol(x.c_str(), &end, 10);
	if( errno == ERANGE || end == x.c_str() || *end != '\0' ){
		return false;
	}
	out = v;
	return true;
}

bool parse_int(const std::string& x, int& out)
{
	long v;
	if( !parse_long(x, v) || v > INT_MAX || v < INT_MIN ){
		return false;
	}
	out = static_cast<int>(v);
	return true;
}

bool parse_double(const std::string& x, double& out)
{
	if( x.empty() || isspace(static_cast<unsigned char>(x[0])) ){
		return false;
	}
	char* end = nullptr;
	double v = strtod(x.c_str(), &end);
	if( end == x.c_str() || *end != '\0' ){
		return false;
	}
	out = v;
	return true;
}

bool parse_bool(const std::string& x, bool& out)
{
	std::string u = to_upper(trim_string(x));
	if( u == "1" || u == "TRUE" || u == "T" || u == "YES" ){
		out = true;
		return true;
	}
	if( u == "0" || u == "FALSE" || u == "F" || u == "NO" ){
		out = false;
		return true;
	}
	return false;
}

double parse_double_na(const std::string& x)
{
	double v;
	if( x == "" || x == NA_STRING || !parse_double(x, v) ){
		return std::numeric_limits<double>::quiet_NaN();
	}
	return v;
}

std::string format_double(const double& x)
{
	if( std::isnan(x) ){
		return NA_STRING;
	}
	return string_format("%.17g", x);
}

std::string utc_timestamp()
{
	std::time_t now = std::time(nullptr);
	std::tm tm_utc;
	gmtime_r(&now, &tm_utc);
	char buf[32];
	strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
	return std::string(buf);
}

std::string utc_compact_timestamp()
{
	std::time_t now = std::time(nullptr);
	std::tm tm_utc;
	gmtime_r(&now, &tm_utc);
	char buf[32];
	strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_utc);
	return std::string(buf);
}

void print_header(const std::vector<std::string>& cn, std::ostream& os){
	bool is_first = true;
	for( const std::string& s : cn ){
		if( is_first ){
			is_first = false;
		}else{
			os << "\t";
		}
		os << s;
	}
	os << "\n";
	return;
}

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


#ifndef PAIRMETA_MISCUTILS_HPP
#define PAIRMETA_MISCUTILS_HPP

#include <cmath>
#include <sstream>
#include <vector>
#include <algorithm>
#include <unordered_set>
#include <string>
#include <memory>
#include <stdexcept>
#include "setOptions.hpp"

template<typename ... Args>
std::string string_format(const std::string& format, Args ... args) {
  int size_s = std::snprintf(nullptr, 0, format.c_str(), args ...) + 1;
  if (size_s <= 0) {
    throw std::runtime_error("Error during formatting.");
  }

  auto size = static_cast<size_t>(size_s);
  auto buf = std::make_unique<char[]>(size);
  std::snprintf(buf.get(), size, format.c_str(), args ...);
  return {buf.get(), buf.get() + size - 1};
}

static const std::string NA_STRING = "NA";

template<typename T>
inline bool has_element(const std::vector<T>& v, const T& x){
	return find(v.begin(), v.end(), x) != v.end();
};

template<typename T>
inline bool has_element(const std::unordered_set<T>& v, const T& x){
	return v.find(x) != v.end();
};

std::vector<std::string> split_string(const std::string&, const char);
std::string trim_string(const std::string&);
std::string to_upper(std::string);

// Strict parsers: the whole field must be consumed.
bool parse_long(const std::string&, long&);
bool parse_int(const std::string&, int&);
bool parse_double(const std::string&, double&);
bool parse_bool(const std::string&, bool&);

// "NA" and "" parse to NaN.
double parse_double_na(const std::string&);

// Round-trip exact (17 significant digits); NaN is written as "NA".
std::string format_double(const double&);

std::string utc_timestamp();
std::string utc_compact_timestamp();

inline void restore_cursor(void){ std::cerr << "\e[?25h"; };
inline void hide_cursor(void){ std::cerr << "\e[?25l"; };
inline void clear_line_cerr(void){ std::cerr << "\33[2K\r"; };

void print_header(const std::vector<std::string>& cn, std::ostream& os);

#endif

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
Generic wrappers for HTSLIB text reading and BGZF writing.
Input tables may be raw text, gzip-compressed, or bgzip-compressed.
*/

#ifndef PAIRMETA_HTSWRAPPERS_HPP
#define PAIRMETA_HTSWRAPPERS_HPP

#include <vector>
#include <string>
#include <functional>
#include <cstdlib>
#include <cstring>

#include "htslib/hts.h"
#include "htslib/bgzf.h"
#include "htslib/kstring.h"

#include "setOptions.hpp"
#include "miscUtils.hpp"


class basic_hts_file
{
	public:
		void open(const std::string& path);
		int next_line(kstring_t& str){ return hts_getline(htsf, KS_SEP_LINE, &str); };

		basic_hts_file() : htsf(nullptr) {};
		basic_hts_file(const std::string& path) : htsf(nullptr) { open(path); };
		~basic_hts_file(){ close(); };

		basic_hts_file(const basic_hts_file&) = delete;
		basic_hts_file& operator=(const basic_hts_file&) = delete;

		void close(){
			if( htsf ){
				hts_close(htsf);
				htsf = nullptr;
			}
		};

	private:
		htsFile *htsf;
};

// Called once per data row with the tab-split fields and the 1-based line number.
using row_callback = std::function<void(const std::vector<std::string>&, const int&)>;

// Reads a tab-separated table. Lines starting with '#' are headers or comments;
// the first such line (without the '#') is returned through header if given.
void read_tsv(const std::string& path, const row_callback& fn, std::vector<std::string>* header = nullptr);

// Writes a BGZF table to a temporary path and renames it into place on commit().
// Nothing is left behind if the writer is destroyed before commit().
class bgzf_table_writer
{
	public:
		bgzf_table_writer(const std::string& path);
		~bgzf_table_writer();

		bgzf_table_writer(const bgzf_table_writer&) = delete;
		bgzf_table_writer& operator=(const bgzf_table_writer&) = delete;

		void write_header(const std::vector<std::string>& cols);
		void write_row(const std::vector<std::string>& fields);

		// Flushes and closes the temporary file; write errors surface here.
		void close();

		// close() then rename into place.
		void commit();

		const std::string& path() const { return final_path; };
		const std::string& temp_path() const { return tmp_path; };
		void mark_committed() { committed = true; };

	private:
		std::string final_path;
		std::string tmp_path;
		BGZF* fp;
		bool committed;
};

// Publishes several tables as one unit: every table is closed before any
// is renamed, then they are renamed in the given order. If a rename fails,
// tables already renamed are put back to their previous contents (or
// removed if they did not exist) and runtime_error is thrown.
void commit_tables(const std::vector<bgzf_table_writer*>& tables);

inline void write_to_bgzf(const std::string& inp, BGZF *fp){
	if( bgzf_write(fp, (const void*) inp.c_str(), inp.length()) < 0 ){
		throw std::runtime_error("Could not write to output file");
	}
};

bool file_exists(const std::string& path);

#endif

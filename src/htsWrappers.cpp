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

#include <cstdio>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

#include "htsWrappers.hpp"

using namespace std;

void basic_hts_file::open(const string& path)
{
	close();
	htsf = hts_open(path.c_str(), "r");
	if( !htsf ){
		throw runtime_error("Could not open file: " + path);
	}
}

bool file_exists(const string& path)
{
	struct stat sb;
	return stat(path.c_str(), &sb) == 0;
}

void read_tsv(const string& path, const row_callback& fn, vector<string>* header)
{
	basic_hts_file hf(path);

	kstring_t str = {0, 0, 0};
	int line_no = 0;
	bool header_done = false;
	int ret;

	while( (ret = hf.next_line(str)) >= 0 )
	{
		line_no++;
		if( !str.l ) continue;

		int n_fields = 0;
		int *offsets = ksplit(&str, '\t', &n_fields);

		vector<string> fields;
		for( int i = 0; i < n_fields; i++ ){
			fields.push_back(trim_string(string(str.s + offsets[i])));
		}
		free(offsets);

		if( fields.size() > 0 && fields[0].size() > 0 && fields[0][0] == '#' ){
			if( !header_done && header != nullptr ){
				fields[0] = fields[0].substr(1);
				*header = fields;
			}
			header_done = true;
			continue;
		}
		fn(fields, line_no);
	}
	ks_free(&str);

	if( ret < -1 ){
		throw runtime_error("Error reading " + path + " after line " + to_string(line_no));
	}
}

bgzf_table_writer::bgzf_table_writer(const string& path) :
	final_path(path), tmp_path(path + ".tmp"), fp(nullptr), committed(false)
{
	fp = bgzf_open(tmp_path.c_str(), "w");
	if( !fp ){
		throw runtime_error("Could not open output file: " + tmp_path);
	}
}

bgzf_table_writer::~bgzf_table_writer()
{
	if( fp ){
		bgzf_close(fp);
		fp = nullptr;
	}
	if( !committed ){
		remove(tmp_path.c_str());
	}
}

void bgzf_table_writer::write_header(const vector<string>& cols)
{
	string line = "#";
	for( size_t i = 0; i < cols.size(); i++ ){
		if( i > 0 ) line += "\t";
		line += cols[i];
	}
	write_to_bgzf(line + "\n", fp);
}

void bgzf_table_writer::write_row(const vector<string>& fields)
{
	string line;
	for( size_t i = 0; i < fields.size(); i++ ){
		if( i > 0 ) line += "\t";
		line += fields[i];
	}
	write_to_bgzf(line + "\n", fp);
}

void bgzf_table_writer::close()
{
	if( !fp ){
		return;
	}
	int ret = bgzf_close(fp);
	fp = nullptr;
	if( ret != 0 ){
		throw runtime_error("Could not close output file: " + tmp_path);
	}
}

void bgzf_table_writer::commit()
{
	close();
	if( rename(tmp_path.c_str(), final_path.c_str()) != 0 ){
		throw runtime_error("Could not move " + tmp_path + " to " + final_path);
	}
	committed = true;
}

void commit_tables(const vector<bgzf_table_writer*>& tables)
{
	for( bgzf_table_writer* t : tables ){
		t->close();
	}

	// previous version of each published table, hard-linked aside
	vector<bool> had_prev;
	vector<bgzf_table_writer*> done;

	auto prev_path = [](const bgzf_table_writer* t){ return t->path() + ".prev"; };

	auto undo = [&](){
		for( size_t i = done.size(); i-- > 0; ){
			if( had_prev[i] ){
				rename(prev_path(done[i]).c_str(), done[i]->path().c_str());
			}else{
				remove(done[i]->path().c_str());
			}
		}
	};

	for( bgzf_table_writer* t : tables ){
		std::error_code ec;
		std::filesystem::remove(prev_path(t), ec);
		bool prev = std::filesystem::is_regular_file(t->path(), ec);
		if( prev ){
			std::filesystem::create_hard_link(t->path(), prev_path(t), ec);
			if( ec ){
				undo();
				throw runtime_error("Could not keep previous " + t->path() + ": " + ec.message());
			}
		}
		if( rename(t->temp_path().c_str(), t->path().c_str()) != 0 ){
			if( prev ) remove(prev_path(t).c_str());
			undo();
			throw runtime_error("Could not move " + t->temp_path() + " to " + t->path());
		}
		t->mark_committed();
		had_prev.push_back(prev);
		done.push_back(t);
	}

	for( size_t i = 0; i < done.size(); i++ ){
		if( had_prev[i] ) remove(prev_path(done[i]).c_str());
	}
}

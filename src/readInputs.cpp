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

#include <iostream>

#include "readInputs.hpp"
#include "htsWrappers.hpp"

static precondition_error bad_row(const std::string& path, const int& line_no, const std::string& msg)
{
	return precondition_error(err_code::INPUT_FORMAT_INVALID, path + " line " + std::to_string(line_no) + ": " + msg);
}

static void need_fields(const std::vector<std::string>& v, const size_t& n, const std::string& path, const int& line_no)
{
	if( v.size() < n ){
		throw bad_row(path, line_no, "expected " + std::to_string(n) + " fields, found " + std::to_string(v.size()));
	}
}

static int int_field(const std::string& x, const std::string& name, const std::string& path, const int& line_no)
{
	int out;
	if( !parse_int(x, out) ){
		throw bad_row(path, line_no, "invalid " + name + " '" + x + "'");
	}
	return out;
}

static bool bool_field(const std::string& x, const std::string& name, const std::string& path, const int& line_no)
{
	bool out;
	if( !parse_bool(x, out) ){
		throw bad_row(path, line_no, "invalid " + name + " '" + x + "' (expected 1/0/true/false)");
	}
	return out;
}

static double num_field(const std::string& x, const std::string& name, const std::string& path, const int& line_no)
{
	if( x == NA_STRING || x == "" ){
		return parse_double_na(x);
	}
	double out;
	if( !parse_double(x, out) ){
		throw bad_row(path, line_no, "invalid " + name + " '" + x + "'");
	}
	return out;
}

// read_tsv reports I/O problems as plain runtime_error
static void read_table(const std::string& path, const row_callback& fn)
{
	try{
		read_tsv(path, fn);
	}catch( const pairmeta_error& ){
		throw;
	}catch( const std::runtime_error& e ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, e.what());
	}
}

gene_reference read_genes(const std::string& path)
{
	gene_reference out;
	read_table(path, [&](const std::vector<std::string>& v, const int& ln){
		need_fields(v, 3, path, ln);
		gene_record g;
		g.gene_key = int_field(v[0], "gene_key", path, ln);
		g.gene_id = v[1];
		g.gene_symbol = v[2];
		out.add(g);
	});
	std::cerr << "Read " << out.n() << " genes from " << path << ".\n";
	return out;
}

void read_diseases(const std::string& path, disease_map& dm)
{
	read_table(path, [&](const std::vector<std::string>& v, const int& ln){
		need_fields(v, 3, path, ln);
		disease_record d;
		d.disease_key = int_field(v[0], "disease_key", path, ln);
		d.label = to_upper(v[1]);
		d.is_active = bool_field(v[2], "is_active", path, ln);
		dm.add_disease(d);
	});
}

void read_studies(const std::string& path, disease_map& dm)
{
	read_table(path, [&](const std::vector<std::string>& v, const int& ln){
		need_fields(v, 3, path, ln);
		study_record s;
		s.study_key = int_field(v[0], "study_key", path, ln);
		s.accession = v[1];
		s.technology = v[2];
		dm.add_study(s);
	});
}

void read_mappings(const std::string& path, disease_map& dm)
{
	read_table(path, [&](const std::vector<std::string>& v, const int& ln){
		need_fields(v, 3, path, ln);
		mapping_record m;
		m.study_key = int_field(v[0], "study_key", path, ln);
		m.disease_key = int_field(v[1], "disease_key", path, ln);
		m.is_active = bool_field(v[2], "is_active", path, ln);
		m.effective_from = v.size() > 3 ? v[3] : NA_STRING;
		m.effective_to = v.size() > 4 ? v[4] : NA_STRING;
		dm.add_mapping(m);
	});
}

disease_map read_disease_map(const std::string& diseases, const std::string& studies, const std::string& mappings)
{
	disease_map dm;
	read_diseases(diseases, dm);
	read_studies(studies, dm);
	read_mappings(mappings, dm);
	std::cerr << "Read " << dm.n_diseases() << " diseases and " << dm.n_studies() << " studies.\n";
	return dm;
}

std::vector<study_component> read_components(const std::string& path)
{
	std::vector<study_component> out;
	read_table(path, [&](const std::vector<std::string>& v, const int& ln){
		if( v.size() != 7 ){
			throw bad_row(path, ln, "expected 7 fields, found " + std::to_string(v.size()));
		}
		study_component c;
		c.study_key = int_field(v[0], "study_key", path, ln);
		c.pair_id = v[1];
		c.metric_name = v[2];
		try{
			c.kind = parse_kind(v[3]);
		}catch( const precondition_error& e ){
			throw bad_row(path, ln, e.detail());
		}
		c.estimate = num_field(v[4], "estimate", path, ln);
		c.standard_error = num_field(v[5], "standard_error", path, ln);
		c.n_samples = num_field(v[6], "n_samples", path, ln);
		c.line_no = ln;
		out.push_back(c);
	});
	std::cerr << "Read " << out.size() << " component estimates from " << path << ".\n";
	return out;
}

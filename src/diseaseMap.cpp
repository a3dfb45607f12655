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

#include "diseaseMap.hpp"

std::string normalize_technology(const std::string& x)
{
	std::string u = to_upper(trim_string(x));
	if( u == "RNA-SEQ" || u == "RNASEQ" || u == "RNA_SEQ" ){
		return "RNA-SEQ";
	}
	if( u == "MICROARRAY" ){
		return "MICROARRAY";
	}
	return "OTHER";
}

void disease_map::add_disease(const disease_record& d)
{
	if( diseases.find(d.disease_key) != diseases.end() ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, "duplicate disease_key " + std::to_string(d.disease_key));
	}
	diseases[d.disease_key] = d;
}

void disease_map::add_study(study_record s)
{
	if( studies.find(s.study_key) != studies.end() ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, "duplicate study_key " + std::to_string(s.study_key));
	}
	s.technology = normalize_technology(s.technology);
	studies[s.study_key] = s;
}

void disease_map::add_mapping(const mapping_record& m)
{
	mappings[m.study_key].push_back(m);
}

const study_record& disease_map::study(const int& study_key) const
{
	auto it = studies.find(study_key);
	if( it == studies.end() ){
		throw precondition_error(err_code::UNKNOWN_STUDY, "study is not in the study reference", error_context(std::to_string(study_key)));
	}
	return it->second;
}

const disease_record& disease_map::disease(const int& disease_key) const
{
	auto it = diseases.find(disease_key);
	if( it == diseases.end() ){
		throw precondition_error(err_code::MISSING_DISEASE_MAPPING, "disease key " + std::to_string(disease_key) + " is not in the disease reference");
	}
	return it->second;
}

const disease_record& disease_map::resolve(const int& study_key) const
{
	error_context ctx(std::to_string(study_key));

	std::vector<const mapping_record*> active;
	auto it = mappings.find(study_key);
	if( it != mappings.end() ){
		for( const mapping_record& m : it->second ){
			if( m.is_active ) active.push_back(&m);
		}
	}

	if( active.size() == 0 ){
		throw precondition_error(err_code::MISSING_DISEASE_MAPPING, "no active disease mapping", ctx);
	}
	if( active.size() > 1 ){
		std::string keys;
		for( const mapping_record* m : active ){
			if( keys != "" ) keys += ",";
			keys += std::to_string(m->disease_key);
		}
		throw precondition_error(err_code::MULTI_DISEASE_MAPPING, std::to_string(active.size()) + " active disease mappings (" + keys + "); mapping table integrity violated", ctx);
	}

	auto d = diseases.find(active[0]->disease_key);
	if( d == diseases.end() ){
		throw precondition_error(err_code::MISSING_DISEASE_MAPPING, "active mapping points to unknown disease key " + std::to_string(active[0]->disease_key), ctx);
	}
	if( !d->second.is_active ){
		throw precondition_error(err_code::INACTIVE_DISEASE, "active mapping points to inactive disease " + d->second.label, ctx);
	}
	return d->second;
}

int disease_map::lookup_disease(const std::string& label_or_key) const
{
	int key;
	if( parse_int(label_or_key, key) ){
		if( diseases.find(key) != diseases.end() ){
			return key;
		}
	}
	std::string u = to_upper(trim_string(label_or_key));
	for( const auto& kv : diseases ){
		if( to_upper(kv.second.label) == u ){
			return kv.first;
		}
	}
	throw precondition_error(err_code::INPUT_FORMAT_INVALID, "unknown disease '" + label_or_key + "'");
}

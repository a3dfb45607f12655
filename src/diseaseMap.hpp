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
	Study, disease and study->disease reference data. The engine only
	reads these tables. resolve() is the precondition gate of every
	aggregation run: a study must have exactly one active mapping, and
	that mapping must point to an active disease.
*/

#ifndef PAIRMETA_DISEASEMAP_HPP
#define PAIRMETA_DISEASEMAP_HPP

#include <string>
#include <vector>
#include <unordered_map>

#include "errors.hpp"
#include "miscUtils.hpp"

struct disease_record
{
	int disease_key;
	std::string label;
	bool is_active;
};

struct study_record
{
	int study_key;
	std::string accession;
	std::string technology;
};

struct mapping_record
{
	int study_key;
	int disease_key;
	bool is_active;
	std::string effective_from;
	std::string effective_to;
};

// RNA-SEQ, MICROARRAY or OTHER.
std::string normalize_technology(const std::string&);

class disease_map
{
	public:
		void add_disease(const disease_record&);
		void add_study(study_record);
		void add_mapping(const mapping_record&);

		// The single active disease for a study.
		const disease_record& resolve(const int& study_key) const;

		const study_record& study(const int& study_key) const;
		const disease_record& disease(const int& disease_key) const;

		// Accepts a disease label (case-insensitive) or a numeric key.
		int lookup_disease(const std::string& label_or_key) const;

		int n_studies() const { return studies.size(); };
		int n_diseases() const { return diseases.size(); };

	private:
		std::unordered_map<int, disease_record> diseases;
		std::unordered_map<int, study_record> studies;
		std::unordered_map<int, std::vector<mapping_record>> mappings;
};

#endif

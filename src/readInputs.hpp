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
	readInputs source files read the reference tables and the
	per-study component table. All are tab-separated with an optional
	header line starting with '#', and may be raw text, gzip or bgzip
	(HTSLIB).

	  genes:      #gene_key  gene_id  gene_symbol
	  diseases:   #disease_key  label  is_active
	  studies:    #study_key  accession  technology
	  mappings:   #study_key  disease_key  is_active  effective_from  effective_to
	  components: #study_key  pair_id  metric_name  kind  estimate  standard_error  n_samples

	Malformed rows raise InputFormatInvalid with the file and line number.
	NA is accepted for estimate, standard_error and n_samples, and for the
	mapping dates.
*/

#ifndef PAIRMETA_READINPUTS_HPP
#define PAIRMETA_READINPUTS_HPP

#include <string>
#include <vector>

#include "errors.hpp"
#include "mapID.hpp"
#include "diseaseMap.hpp"
#include "suffStats.hpp"

gene_reference read_genes(const std::string& path);

void read_diseases(const std::string& path, disease_map& dm);
void read_studies(const std::string& path, disease_map& dm);
void read_mappings(const std::string& path, disease_map& dm);

disease_map read_disease_map(const std::string& diseases, const std::string& studies, const std::string& mappings);

std::vector<study_component> read_components(const std::string& path);

#endif

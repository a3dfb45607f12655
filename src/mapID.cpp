/*
    Copyright (C) 2020
    Author: Corbin Quick <qcorbin@hsph.harvard.edu>

    This file is part of PAIRMETA.

    PAIRMETA is distributed "AS IS" in the hope that it will be
    useful, but WITHOUT ANY WARRANTY; without even the implied
    warranty of MERCHANTABILITY, NONINFRINGEMENT, or FITNESS
    FOR A PARTICULAR PURPOSE.

    The above copyright notice and this permission notice shall
    be included in all copies or substantial portions of PAIRMETA.
*/


/*
	mapID source files and the 'gene_pair_index' class map unordered
	gene pairs onto stable pair keys. See mapID.hpp.
*/

#include "mapID.hpp"


void gene_reference::add(const gene_record& g)
{
	if( genes.find(g.gene_key) != genes.end() ){
		throw precondition_error(err_code::INPUT_FORMAT_INVALID, "duplicate gene_key " + std::to_string(g.gene_key) + " in gene reference");
	}
	genes[g.gene_key] = g;
}

bool gene_reference::has(const int& gene_key) const
{
	return genes.find(gene_key) != genes.end();
}

const gene_record& gene_reference::get(const int& gene_key) const
{
	auto it = genes.find(gene_key);
	if( it == genes.end() ){
		throw precondition_error(err_code::PAIR_GENE_KEY_NOT_FOUND, "gene key " + std::to_string(gene_key) + " is not in the gene reference");
	}
	return it->second;
}

std::string gene_reference::symbol(const int& gene_key) const
{
	auto it = genes.find(gene_key);
	if( it == genes.end() ){
		return NA_STRING;
	}
	return it->second.gene_symbol;
}

std::pair<int,int> parse_pair_id(const std::string& pair_id)
{
	std::vector<std::string> parts = split_string(pair_id, '_');

	// split_string drops a trailing empty field, so "1_2_" would look valid
	bool ok = parts.size() == 2 && pair_id.size() > 0 && pair_id.back() != '_';

	int a = 0, b = 0;
	if( ok ){
		ok = parse_int(parts[0], a) && parse_int(parts[1], b);
	}
	if( !ok ){
		throw precondition_error(err_code::PAIR_ID_FORMAT_INVALID, "pair id '" + pair_id + "' is not of the form <geneA_key>_<geneB_key>", error_context("", pair_id));
	}
	if( a == b ){
		throw precondition_error(err_code::PAIR_ID_FORMAT_INVALID, "pair id '" + pair_id + "' names the same gene twice", error_context("", pair_id));
	}
	return std::make_pair(a, b);
}

std::pair<int,int> canonical_order(const int& a, const int& b)
{
	if( a < b ){
		return std::make_pair(a, b);
	}
	return std::make_pair(b, a);
}

long gene_pair_index::find(const int& a, const int& b) const
{
	auto it = by_genes.find(canonical_order(a, b));
	if( it == by_genes.end() ){
		return -1;
	}
	return it->second;
}

long gene_pair_index::resolve(const int& a, const int& b, const gene_reference& genes)
{
	std::string pair_id = std::to_string(a) + "_" + std::to_string(b);
	for( const int& g : {a, b} ){
		if( !genes.has(g) ){
			throw precondition_error(err_code::PAIR_GENE_KEY_NOT_FOUND, "gene key " + std::to_string(g) + " is not in the gene reference", error_context("", pair_id));
		}
	}
	if( a == b ){
		throw precondition_error(err_code::PAIR_ID_FORMAT_INVALID, "a pair needs two distinct genes", error_context("", pair_id));
	}

	std::pair<int,int> ab = canonical_order(a, b);
	auto it = by_genes.find(ab);
	if( it != by_genes.end() ){
		return it->second;
	}

	gene_pair gp;
	gp.pair_key = pairs.size() + 1;
	gp.gene_a = ab.first;
	gp.gene_b = ab.second;
	pairs.push_back(gp);
	by_genes[ab] = gp.pair_key;
	return gp.pair_key;
}

long gene_pair_index::resolve(const std::string& pair_id, const gene_reference& genes)
{
	std::pair<int,int> ab = parse_pair_id(pair_id);
	return resolve(ab.first, ab.second, genes);
}

bool gene_pair_index::has_pair(const long& pair_key) const
{
	return pair_key >= 1 && pair_key <= (long) pairs.size();
}

const gene_pair& gene_pair_index::get(const long& pair_key) const
{
	if( !has_pair(pair_key) ){
		throw std::out_of_range("unknown pair_key " + std::to_string(pair_key));
	}
	return pairs[pair_key - 1];
}

void gene_pair_index::insert(const gene_pair& gp)
{
	if( gp.pair_key != (long) pairs.size() + 1 ){
		throw std::runtime_error("gene pairs out of order: expected pair_key " + std::to_string(pairs.size() + 1) + ", got " + std::to_string(gp.pair_key));
	}
	if( !(gp.gene_a < gp.gene_b) ){
		throw std::runtime_error("gene pair " + std::to_string(gp.pair_key) + " is not in canonical order");
	}
	std::pair<int,int> ab(gp.gene_a, gp.gene_b);
	if( by_genes.find(ab) != by_genes.end() ){
		throw std::runtime_error("duplicate gene pair " + std::to_string(gp.gene_a) + "_" + std::to_string(gp.gene_b));
	}
	pairs.push_back(gp);
	by_genes[ab] = gp.pair_key;
}

std::vector<gene_pair> gene_pair_index::created_since(const long& n_before) const
{
	std::vector<gene_pair> out;
	for( long i = n_before; i < (long) pairs.size(); i++ ){
		out.push_back(pairs[i]);
	}
	return out;
}

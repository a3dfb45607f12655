/*
	GENE AND GENE-PAIR ID MANAGEMENT

	mapID source files hold the gene reference set and the 'gene_pair_index'
	class, which maps an unordered pair of gene keys to a single pair_key.
	Pairs are stored in canonical order (gene_a < gene_b), so resolving
	(a,b) and (b,a) always returns the same key, and a pair is created
	the first time either ordering is seen.

	External pair ids have the form "<geneA_key>_<geneB_key>".
*/

#ifndef PAIRMETA_MAPID_HPP
#define PAIRMETA_MAPID_HPP

#include <vector>
#include <map>
#include <string>
#include <unordered_map>

#include "errors.hpp"
#include "miscUtils.hpp"
#include "setOptions.hpp"


struct gene_record
{
	int gene_key;
	std::string gene_id;
	std::string gene_symbol;
};

class gene_reference
{
	public:
		void add(const gene_record&);

		bool has(const int& gene_key) const;
		const gene_record& get(const int& gene_key) const;
		std::string symbol(const int& gene_key) const;

		int n() const { return genes.size(); };

	private:
		std::unordered_map<int, gene_record> genes;
};

struct gene_pair
{
	long pair_key;
	int gene_a;
	int gene_b;
};

// Splits "<a>_<b>" into two integer gene keys; throws PairIdFormatInvalid.
std::pair<int,int> parse_pair_id(const std::string& pair_id);

std::pair<int,int> canonical_order(const int& a, const int& b);

class gene_pair_index
{
	public:
		// Returns the pair_key, creating the pair if absent.
		long resolve(const int& a, const int& b, const gene_reference& genes);
		long resolve(const std::string& pair_id, const gene_reference& genes);

		// -1 if the pair has not been created yet.
		long find(const int& a, const int& b) const;

		bool has_pair(const long& pair_key) const;
		const gene_pair& get(const long& pair_key) const;

		// Used when loading stored pairs; keys must arrive in order 1, 2, ...
		void insert(const gene_pair& gp);

		// Pairs with pair_key > n_before.
		std::vector<gene_pair> created_since(const long& n_before) const;

		long n() const { return pairs.size(); };
		const std::vector<gene_pair>& all() const { return pairs; };

	private:
		std::vector<gene_pair> pairs;
		std::map<std::pair<int,int>, long> by_genes;
};

#endif

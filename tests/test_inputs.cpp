#include <gtest/gtest.h>
#include "errors.hpp"
#include "readInputs.hpp"
#include "miscUtils.hpp"
#include <cmath>
#include <fstream>
#include <string>
#include "test_util.h"
using namespace std;

static string write_file(const string &dir, const string &name, const string &text) {
  string path = dir + "/" + name;
  ofstream out(path);
  out << text;
  return path;
}

class InputsTest : public ::testing::Test {
  protected:
    string dir;
    void SetUp() override { dir = scratch_dir("inputs"); }
    void TearDown() override { std::filesystem::remove_all(dir); }
};

TEST_F(InputsTest, ReadsReferenceTables) {
  string genes = write_file(dir, "genes.tsv", "#gene_key\tgene_id\tgene_symbol\n1\tENSG1\tIL6\n2\tENSG2\tTNF\n");
  string diseases = write_file(dir, "diseases.tsv", "#disease_key\tlabel\tis_active\n1\tsepsis\ttrue\n2\tcontrol\t0\n");
  string studies = write_file(dir, "studies.tsv", "#study_key\taccession\ttechnology\n10\tGSE10\trnaseq\n");
  string mappings = write_file(dir, "mappings.tsv", "#study_key\tdisease_key\tis_active\teffective_from\teffective_to\n10\t1\t1\n");

  gene_reference g = read_genes(genes);
  ASSERT_EQ(g.n(), 2);
  ASSERT_EQ(g.symbol(2), "TNF");

  disease_map dm = read_disease_map(diseases, studies, mappings);
  ASSERT_EQ(dm.n_diseases(), 2);
  ASSERT_EQ(dm.resolve(10).label, "SEPSIS");
  ASSERT_EQ(dm.study(10).technology, "RNA-SEQ");
  ASSERT_EQ(dm.lookup_disease("Control"), 2);
}

TEST_F(InputsTest, ReadsComponents) {
  string path = write_file(dir, "components.tsv",
    "#study_key\tpair_id\tmetric_name\tkind\testimate\tstandard_error\tn_samples\n"
    "10\t1_2\tlogFC\teffect\t0.25\t0.1\t40\n"
    "10\t2_3\tpearson\tcorrelation\t-0.4\tNA\t55\n");

  vector<study_component> c = read_components(path);
  ASSERT_EQ(c.size(), 2u);
  ASSERT_EQ(c[0].pair_id, "1_2");
  ASSERT_EQ(c[0].kind, metric_kind::effect);
  ASSERT_DOUBLE_EQ(c[0].standard_error, 0.1);
  ASSERT_EQ(c[1].kind, metric_kind::correlation);
  ASSERT_TRUE(std::isnan(c[1].standard_error));
  ASSERT_DOUBLE_EQ(c[1].n_samples, 55.0);
  ASSERT_EQ(c[1].line_no, 3);
}

TEST_F(InputsTest, MalformedRowsAreRejected) {
  string short_row = write_file(dir, "short.tsv", "10\t1_2\tlogFC\teffect\t0.25\t0.1\n");
  string bad_kind = write_file(dir, "kind.tsv", "10\t1_2\tlogFC\tslope\t0.25\t0.1\t40\n");
  string bad_num = write_file(dir, "num.tsv", "10\t1_2\tlogFC\teffect\tbig\t0.1\t40\n");
  string bad_bool = write_file(dir, "bool.tsv", "1\tsepsis\tmaybe\n");

  for (const string &path : {short_row, bad_kind, bad_num}) {
    try {
      read_components(path);
      FAIL() << path;
    }
    catch (const precondition_error &e) {
      ASSERT_EQ(e.code(), err_code::INPUT_FORMAT_INVALID);
      ASSERT_NE(string(e.what()).find("line 1"), string::npos) << e.what();
    }
  }

  disease_map dm;
  ASSERT_THROW(read_diseases(bad_bool, dm), precondition_error);
}

TEST_F(InputsTest, MissingFile) {
  ASSERT_THROW(read_genes(dir + "/absent.tsv"), precondition_error);
}

TEST(MiscUtilsTest, HighBitBytes) {
  ASSERT_EQ(to_upper("rna-seq s\xc3\xa9psis"), "RNA-SEQ S\xc3\xa9PSIS");

  int i = 7;
  ASSERT_FALSE(parse_int("\xa0" "5", i));
  ASSERT_EQ(i, 7);
  double d = 1.0;
  ASSERT_FALSE(parse_double("\xe2\x80\x83" "1.5", d));
  ASSERT_EQ(d, 1.0);
  ASSERT_TRUE(parse_double("-1.5", d));
  ASSERT_EQ(d, -1.5);
}

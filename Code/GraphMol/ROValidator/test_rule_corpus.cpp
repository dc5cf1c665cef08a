#include <GraphMol/ROValidator/errors.hpp>
#include <GraphMol/ROValidator/identifier_renames.hpp>
#include <GraphMol/ROValidator/rule_corpus.hpp>
#include <catch2/catch_all.hpp>
#include <sstream>

using namespace ro_validator;

namespace {
const char *CORPUS_TSV =
    "id\trule\tsubstrate_count\tproduct_count\tcuration_status\tname\n"
    "1\t[C:1][OH:2]>>[C:1]=[O:2]\t1\t1\tperfect\toxidation\n"
    "# disabled rule\n"
    "\n"
    "2\t[C:1](=O)[OH].[N:2]>>[C:1](=O)[N:2]\t2\t1\tmanually_validated\t\n"
    "3\t[c:1][H]>>[c:1]O\t1\t1\t\thydroxylation\n"
    "4\t[C:1]Cl>>[C:1].Cl\t1\t2\tmanually_invalidated\t\n";

RuleCorpus load_corpus(const std::string &text) {
  std::istringstream in(text);
  return RuleCorpus::load(in, "corpus.tsv");
}
}  // namespace

struct RuleCorpusFixture {
  RuleCorpus corpus = load_corpus(CORPUS_TSV);
};

TEST_CASE_METHOD(RuleCorpusFixture, "RuleCorpus: load tab separated corpus",
                 "[RuleCorpus]") {
  REQUIRE(corpus.size() == 4);
  CHECK(corpus.rules()[0]->id == 1);
  CHECK(corpus.rules()[0]->rule_template == "[C:1][OH:2]>>[C:1]=[O:2]");
  CHECK(corpus.rules()[0]->curation_status == CurationStatus::Perfect);
  CHECK(corpus.rules()[0]->name == "oxidation");
  CHECK(corpus.rules()[1]->substrate_arity == 2);
  CHECK(corpus.rules()[2]->curation_status == CurationStatus::Unknown);
  CHECK(corpus.rules()[3]->product_arity == 2);

  REQUIRE(corpus.find(3));
  CHECK(corpus.find(3)->name == "hydroxylation");
  CHECK_FALSE(corpus.find(42));
}

TEST_CASE("RuleCorpus: legacy category and manual_validation columns",
          "[RuleCorpus]") {
  auto corpus = load_corpus(
      "ro_id,ro,substrate_count,category,manual_validation\n"
      "10,\"[C,N:1]>>[C,N:1]O\",1,perfect,false\n"
      "11,[C:1]>>[C:1]O,1,,TRUE\n"
      "12,[C:1]>>[C:1]O,1,,0\n"
      "13,[C:1]>>[C:1]O,1,,null\n");
  REQUIRE(corpus.size() == 4);
  // the perfect category wins over a manual verdict
  CHECK(corpus.rules()[0]->curation_status == CurationStatus::Perfect);
  CHECK(corpus.rules()[0]->rule_template == "[C,N:1]>>[C,N:1]O");
  CHECK(corpus.rules()[1]->curation_status ==
        CurationStatus::ManuallyValidated);
  CHECK(corpus.rules()[2]->curation_status ==
        CurationStatus::ManuallyInvalidated);
  CHECK(corpus.rules()[3]->curation_status == CurationStatus::Unknown);
}

TEST_CASE("RuleCorpus: load errors", "[RuleCorpus]") {
  CHECK_THROWS_AS(load_corpus(""), CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\n1\t[C:1]>>[C:1]O\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\n"
                              "x\t[C:1]>>[C:1]O\t1\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\n"
                              "1\t[C:1]>>[C:1]O\t0\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\n"
                              "1\t\t1\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\n"
                              "1\t[C:1]>>[C:1]O\t1\n"
                              "1\t[N:1]>>[N:1]O\t1\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\tcuration_status\n"
                              "1\t[C:1]>>[C:1]O\t1\tapproved\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(RuleCorpus::load("/nonexistent/rules.tsv"), CorpusLoadError);
}

TEST_CASE("RuleCorpus: arity values must fit", "[RuleCorpus]") {
  // 2^32 + 1 would narrow to 1
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\n"
                              "1\t[C:1]>>[C:1]O\t4294967297\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\n"
                              "1\t[C:1]>>[C:1]O\t-1\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\tproduct_count\n"
                              "1\t[C:1]>>[C:1]O\t1\t-3\n"),
                  CorpusLoadError);
  CHECK_THROWS_AS(load_corpus("id\trule\tsubstrate_count\tproduct_count\n"
                              "1\t[C:1]>>[C:1]O\t1\t4294967297\n"),
                  CorpusLoadError);

  auto corpus = load_corpus("id\trule\tsubstrate_count\tproduct_count\n"
                            "1\t[C:1]>>[C:1]O\t2147483647\t0\n");
  REQUIRE(corpus.size() == 1);
  CHECK(corpus.rules()[0]->substrate_arity == 2147483647);
  CHECK(corpus.rules()[0]->product_arity == 0);
  CHECK(corpus.filter_by_substrate_arity(1).empty());
}

TEST_CASE("RuleCorpus: error message names the line", "[RuleCorpus]") {
  try {
    load_corpus("id\trule\tsubstrate_count\n"
                "1\t[C:1]>>[C:1]O\t1\n"
                "2\t[C:1]>>[C:1]O\tmany\n");
    FAIL("expected CorpusLoadError");
  } catch (const CorpusLoadError &e) {
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("corpus.tsv"));
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("line 3"));
  }
}

TEST_CASE_METHOD(RuleCorpusFixture, "RuleCorpus: filters are pure",
                 "[RuleCorpus]") {
  auto single = corpus.filter_by_substrate_arity(1);
  CHECK(single.size() == 3);
  for (const auto &rule : single.rules()) {
    CHECK(rule->substrate_arity == 1);
  }
  CHECK(corpus.filter_by_substrate_arity(3).empty());
  CHECK(corpus.filter_by_product_arity(2).size() == 1);

  auto curated = corpus.filter_by_curation_status(
      {CurationStatus::Perfect, CurationStatus::ManuallyValidated});
  REQUIRE(curated.size() == 2);
  CHECK(curated.rules()[0]->id == 1);
  CHECK(curated.rules()[1]->id == 2);

  // order follows the corpus, not the id list
  auto picked = corpus.filter_by_ids({4, 1, 99});
  REQUIRE(picked.size() == 2);
  CHECK(picked.rules()[0]->id == 1);
  CHECK(picked.rules()[1]->id == 4);

  // filtered corpora share the rules with their source
  CHECK(single.rules()[0].get() == corpus.rules()[0].get());
  CHECK(corpus.size() == 4);
}

TEST_CASE("IdentifierRenames: load and apply", "[RuleCorpus]") {
  std::istringstream in(
      "wrong_inchi\tcorrect_inchi\n"
      "InChI=1S/bad\tInChI=1S/good\n");
  auto renames = IdentifierRenames::load(in, "renames.tsv");
  CHECK(renames.size() == 1);
  CHECK(renames.rename_if_listed("InChI=1S/bad") == "InChI=1S/good");
  CHECK(renames.rename_if_listed("InChI=1S/other") == "InChI=1S/other");

  // the result outlives a temporary argument
  const auto &kept = renames.rename_if_listed(std::string("InChI=1S/") + "x");
  CHECK(kept == "InChI=1S/x");

  std::istringstream broken("wrong_identifier\tcorrect_identifier\nonly\n");
  CHECK_THROWS_AS(IdentifierRenames::load(broken, "broken.tsv"),
                  CorpusLoadError);
}

#include "test_stub_engine.hpp"

#include <GraphMol/ROValidator/rule_projector.hpp>
#include <catch2/catch_all.hpp>

using namespace ro_validator;
using ro_validator::testing::make_rule;
using ro_validator::testing::StubEngine;

struct RuleProjectorFixture {
  StubEngine engine;
  RuleProjector projector{engine};

  std::vector<Structure> structures(const std::vector<std::string> &ids) {
    std::vector<Structure> res;
    for (const auto &id : ids) {
      res.push_back(Structure{id, nullptr});
    }
    return res;
  }
};

TEST_CASE_METHOD(RuleProjectorFixture,
                 "RuleProjector: product sets are capped", "[RuleProjector]") {
  const auto rule = make_rule(1);
  StubEngine::Sets many;
  for (int i = 0; i < 50; ++i) {
    many.push_back({"P" + std::to_string(i)});
  }
  engine.outputs[1] = many;

  auto result = projector.project(rule, structures({"S"}));
  REQUIRE(result.ok());
  CHECK(result.product_sets.size() == MAX_PROJECTIONS);
  CHECK(result.product_sets.front().front().source_identifier == "P0");

  // only the first MAX_PROJECTIONS candidates are examined
  CHECK(projector.score(rule, projector.project(rule, structures({"S"}))
                                  .product_sets,
                        {"P9"})
            .matched);
  CHECK_FALSE(projector.score(rule, projector.project(rule, structures({"S"}))
                                        .product_sets,
                              {"P10"})
                  .matched);

  // score() honours the cap on unbounded candidate lists as well
  std::vector<ProductSet> unbounded;
  for (int i = 0; i < 50; ++i) {
    unbounded.push_back(structures({"P" + std::to_string(i)}));
  }
  CHECK_FALSE(projector.score(rule, unbounded, {"P30"}).matched);
}

TEST_CASE_METHOD(RuleProjectorFixture, "RuleProjector: custom cap",
                 "[RuleProjector]") {
  ProjectorOptions opts;
  opts.max_projections = 2;
  RuleProjector small(engine, opts);
  engine.outputs[1] = {{"A"}, {"B"}, {"C"}};
  auto result = small.project(make_rule(1), structures({"S"}));
  CHECK(result.product_sets.size() == 2);
}

TEST_CASE_METHOD(RuleProjectorFixture,
                 "RuleProjector: one matching structure is enough",
                 "[RuleProjector]") {
  // R7 is perfect and produces {P, Q} among its candidates
  const auto r7 = make_rule(7, CurationStatus::Perfect);
  engine.outputs[7] = {{"X"}, {"Y", "Q"}, {"P"}};

  auto verdict =
      projector.project_and_score(r7, structures({"S"}), {"P", "Z"});
  CHECK(verdict == ScoreVerdict::match(4));

  verdict = projector.project_and_score(r7, structures({"S"}), {"Q"});
  CHECK(verdict == ScoreVerdict::match(4));

  verdict = projector.project_and_score(r7, structures({"S"}), {"Z"});
  CHECK(verdict == ScoreVerdict::unmatch());
}

TEST_CASE_METHOD(RuleProjectorFixture,
                 "RuleProjector: score follows curation status",
                 "[RuleProjector]") {
  engine.outputs[1] = {{"P"}};
  engine.outputs[2] = {{"P"}};
  engine.outputs[3] = {{"P"}};
  const auto substrates = structures({"S"});
  CHECK(projector
            .project_and_score(make_rule(1, CurationStatus::ManuallyValidated),
                               substrates, {"P"})
            .score == 3);
  CHECK(projector.project_and_score(make_rule(2), substrates, {"P"}).score ==
        2);
  auto invalidated = projector.project_and_score(
      make_rule(3, CurationStatus::ManuallyInvalidated), substrates, {"P"});
  CHECK(invalidated.matched);
  CHECK(invalidated.score == 0);
}

TEST_CASE_METHOD(RuleProjectorFixture,
                 "RuleProjector: failures score unmatch", "[RuleProjector]") {
  const auto rule = make_rule(5, CurationStatus::Perfect);
  engine.outputs[5] = {{"P"}};

  SECTION("engine failure") {
    engine.failures[5] = ProjectionErrorKind::EngineFailure;
    auto result = projector.project(rule, structures({"S"}));
    REQUIRE_FALSE(result.ok());
    CHECK(result.failure->kind == ProjectionErrorKind::EngineFailure);
    CHECK(projector.project_and_score(rule, structures({"S"}), {"P"}) ==
          ScoreVerdict::unmatch());
    CHECK(projector.stats().projection_failures == 2);
  }

  SECTION("no substrates never reaches the engine") {
    auto result = projector.project(rule, {});
    REQUIRE_FALSE(result.ok());
    CHECK(result.failure->kind == ProjectionErrorKind::NoSubstrates);
    CHECK(engine.total_project_calls == 0);
  }

  SECTION("empty expected set") {
    CHECK(projector.project_and_score(rule, structures({"S"}), {}) ==
          ScoreVerdict::unmatch());
  }

  SECTION("no products") {
    engine.outputs[5].clear();
    CHECK(projector.project_and_score(rule, structures({"S"}), {"P"}) ==
          ScoreVerdict::unmatch());
  }

  SECTION("unexportable product is skipped") {
    engine.outputs[5] = {{"BAD", "P"}};
    engine.uncanonicalizable.insert("BAD");
    CHECK(projector.project_and_score(rule, structures({"S"}), {"P"}) ==
          ScoreVerdict::match(4));
    CHECK(projector.stats().canonicalization_failures == 1);
  }
}

TEST_CASE_METHOD(RuleProjectorFixture,
                 "RuleProjector: substrates reach the engine in order",
                 "[RuleProjector]") {
  const auto rule = make_rule(2, CurationStatus::Unknown, 2);
  projector.project(rule, structures({"A", "B", "B"}));
  CHECK(engine.last_inputs[2] == "A.B.B");
}

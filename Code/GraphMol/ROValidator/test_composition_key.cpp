#include <GraphMol/ROValidator/composition_key.hpp>
#include <GraphMol/ROValidator/types.hpp>
#include <catch2/catch_all.hpp>
#include <unordered_set>

using namespace ro_validator;

struct CompositionKeyFixture {
  // A + 2 B -> 3 C
  ObservedReaction rxn = ObservedReaction(1)
                             .add_substrate(10, 1)
                             .add_substrate(20, 2)
                             .add_product(30, 3);
};

TEST_CASE("ObservedReaction: participants by role", "[CompositionKey]") {
  ObservedReaction rxn(5);
  rxn.add_substrate(2).add_substrate(1, std::nullopt).add_product(3, 2);

  CHECK(rxn.substrates() == std::vector<ChemicalId>{2, 1});
  CHECK(rxn.products() == std::vector<ChemicalId>{3});
  CHECK(rxn.substrate_coefficient(2) == 1);
  CHECK_FALSE(rxn.substrate_coefficient(1).has_value());
  CHECK_FALSE(rxn.substrate_coefficient(3).has_value());
  CHECK(rxn.product_coefficient(3) == 2);

  // re-adding replaces the coefficient
  rxn.add_substrate(2, 4);
  CHECK(rxn.substrates().size() == 2);
  CHECK(rxn.substrate_coefficient(2) == 4);
}

TEST_CASE_METHOD(CompositionKeyFixture,
                 "CompositionKey: legacy policy reads products as substrates",
                 "[CompositionKey]") {
  auto key = make_composition_key(rxn, CoefficientPolicy::SubstrateAccessor);
  CHECK(key.substrates.at(10) == 1);
  CHECK(key.substrates.at(20) == 2);
  REQUIRE(key.products.count(30) == 1);
  CHECK_FALSE(key.products.at(30).has_value());

  // product coefficients do not distinguish keys under this policy
  ObservedReaction other(2);
  other.add_substrate(10, 1).add_substrate(20, 2).add_product(30, 7);
  CHECK(make_composition_key(other, CoefficientPolicy::SubstrateAccessor) ==
        key);
}

TEST_CASE_METHOD(CompositionKeyFixture,
                 "CompositionKey: role policy reads product coefficients",
                 "[CompositionKey]") {
  auto key = make_composition_key(rxn, CoefficientPolicy::RoleAccessor);
  CHECK(key.products.at(30) == 3);

  ObservedReaction other(2);
  other.add_substrate(10, 1).add_substrate(20, 2).add_product(30, 7);
  CHECK(make_composition_key(other, CoefficientPolicy::RoleAccessor) != key);
}

TEST_CASE_METHOD(CompositionKeyFixture,
                 "CompositionKey: order of insertion does not matter",
                 "[CompositionKey]") {
  ObservedReaction reordered(9);
  reordered.add_product(30, 3).add_substrate(20, 2).add_substrate(10, 1);

  auto a = make_composition_key(rxn);
  auto b = make_composition_key(reordered);
  CHECK(a == b);
  CHECK(CompositionKeyHash()(a) == CompositionKeyHash()(b));
}

TEST_CASE_METHOD(CompositionKeyFixture,
                 "CompositionKey: different substrates give different keys",
                 "[CompositionKey]") {
  ObservedReaction more(3);
  more.add_substrate(10, 2).add_substrate(20, 2).add_product(30, 3);
  ObservedReaction fewer(4);
  fewer.add_substrate(10, 1).add_product(30, 3);

  std::unordered_set<CompositionKey, CompositionKeyHash> keys;
  keys.insert(make_composition_key(rxn));
  keys.insert(make_composition_key(more));
  keys.insert(make_composition_key(fewer));
  keys.insert(make_composition_key(rxn));
  CHECK(keys.size() == 3);
}

#ifndef RO_VALIDATOR_COMPOSITION_KEY_HPP
#define RO_VALIDATOR_COMPOSITION_KEY_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/types.hpp>
#include <cstddef>
#include <map>
#include <optional>

namespace ro_validator {

/**
 * How product coefficients are read when building a CompositionKey.
 *
 * SubstrateAccessor looks products up with the substrate-coefficient
 * accessor, as the legacy validator did. A chemical that is only a product
 * then has no coefficient, so product stoichiometry does not distinguish
 * keys. RoleAccessor reads each chemical with the accessor for its role.
 */
enum class CoefficientPolicy { SubstrateAccessor, RoleAccessor };

/**
 * Coefficient of `id` in `role` under `policy`. Empty when the reaction
 * records none.
 */
RDKIT_ROVALIDATOR_EXPORT std::optional<int> coefficient_for(
    const ObservedReaction &reaction, ChemicalId id, ChemicalRole role,
    CoefficientPolicy policy);

/**
 * Substrate and product composition of a reaction. Reactions with equal
 * keys are assumed to score identically against a rule corpus, which holds
 * while rules ignore cofactors.
 */
struct RDKIT_ROVALIDATOR_EXPORT CompositionKey {
  std::map<ChemicalId, std::optional<int>> substrates;
  std::map<ChemicalId, std::optional<int>> products;

  bool operator==(const CompositionKey &o) const {
    return substrates == o.substrates && products == o.products;
  }
  bool operator!=(const CompositionKey &o) const { return !(*this == o); }
  bool operator<(const CompositionKey &o) const {
    if (substrates != o.substrates) {
      return substrates < o.substrates;
    }
    return products < o.products;
  }
};

struct RDKIT_ROVALIDATOR_EXPORT CompositionKeyHash {
  std::size_t operator()(const CompositionKey &k) const noexcept;
};

RDKIT_ROVALIDATOR_EXPORT CompositionKey make_composition_key(
    const ObservedReaction &reaction,
    CoefficientPolicy policy = CoefficientPolicy::SubstrateAccessor);

}  // namespace ro_validator

#endif  // RO_VALIDATOR_COMPOSITION_KEY_HPP

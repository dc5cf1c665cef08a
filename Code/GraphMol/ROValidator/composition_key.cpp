#include "composition_key.hpp"

#include <functional>

namespace ro_validator {

std::optional<int> coefficient_for(const ObservedReaction &reaction,
                                   ChemicalId id, ChemicalRole role,
                                   CoefficientPolicy policy) {
  if (role == ChemicalRole::Product &&
      policy == CoefficientPolicy::RoleAccessor) {
    return reaction.product_coefficient(id);
  }
  return reaction.substrate_coefficient(id);
}

namespace {
inline void hash_combine(std::size_t &seed, std::size_t h) {
  seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

std::size_t hash_side(const std::map<ChemicalId, std::optional<int>> &side) {
  std::size_t seed = side.size();
  for (const auto &[id, coeff] : side) {
    hash_combine(seed, std::hash<ChemicalId>()(id));
    hash_combine(seed, coeff ? std::hash<int>()(*coeff) : 0x5bd1e995u);
  }
  return seed;
}
}  // namespace

std::size_t CompositionKeyHash::operator()(
    const CompositionKey &k) const noexcept {
  std::size_t h = hash_side(k.substrates);
  hash_combine(h, hash_side(k.products));
  return h;
}

CompositionKey make_composition_key(const ObservedReaction &reaction,
                                    CoefficientPolicy policy) {
  CompositionKey key;
  for (const auto id : reaction.substrates()) {
    key.substrates[id] =
        coefficient_for(reaction, id, ChemicalRole::Substrate, policy);
  }
  for (const auto id : reaction.products()) {
    key.products[id] =
        coefficient_for(reaction, id, ChemicalRole::Product, policy);
  }
  return key;
}

}  // namespace ro_validator

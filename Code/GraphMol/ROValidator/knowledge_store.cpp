#include "knowledge_store.hpp"

namespace ro_validator {

void InMemoryKnowledgeStore::add_reaction(const ObservedReaction &reaction) {
  d_reactions.insert_or_assign(reaction.id(), reaction);
}

void InMemoryKnowledgeStore::add_chemical(ChemicalId chemical_id,
                                          const std::string &identifier) {
  d_chemicals.insert_or_assign(chemical_id, identifier);
}

std::optional<ObservedReaction> InMemoryKnowledgeStore::read_reaction(
    std::int64_t reaction_id) const {
  auto it = d_reactions.find(reaction_id);
  if (it == d_reactions.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string>
InMemoryKnowledgeStore::read_chemical_structure_identifier(
    ChemicalId chemical_id) const {
  auto it = d_chemicals.find(chemical_id);
  if (it == d_chemicals.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace ro_validator

#ifndef RO_VALIDATOR_KNOWLEDGE_STORE_HPP
#define RO_VALIDATOR_KNOWLEDGE_STORE_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace ro_validator {

/**
 * Read access to the reactions and chemicals being validated.
 */
class RDKIT_ROVALIDATOR_EXPORT KnowledgeStore {
 public:
  virtual ~KnowledgeStore() = default;

  virtual std::optional<ObservedReaction> read_reaction(
      std::int64_t reaction_id) const = 0;
  virtual std::optional<std::string> read_chemical_structure_identifier(
      ChemicalId chemical_id) const = 0;
};

class RDKIT_ROVALIDATOR_EXPORT InMemoryKnowledgeStore : public KnowledgeStore {
 public:
  // Replaces any reaction with the same id.
  void add_reaction(const ObservedReaction &reaction);
  // Replaces any identifier already recorded for this chemical.
  void add_chemical(ChemicalId chemical_id, const std::string &identifier);

  std::optional<ObservedReaction> read_reaction(
      std::int64_t reaction_id) const override;
  std::optional<std::string> read_chemical_structure_identifier(
      ChemicalId chemical_id) const override;

  std::size_t num_reactions() const { return d_reactions.size(); }
  std::size_t num_chemicals() const { return d_chemicals.size(); }

 private:
  std::unordered_map<std::int64_t, ObservedReaction> d_reactions;
  std::unordered_map<ChemicalId, std::string> d_chemicals;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_KNOWLEDGE_STORE_HPP

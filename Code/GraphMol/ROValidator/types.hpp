#ifndef RO_VALIDATOR_TYPES_HPP
#define RO_VALIDATOR_TYPES_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROMol.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ro_validator {

using RuleId = std::int64_t;
using ChemicalId = std::int64_t;

/**
 * Human-review label attached to a transformation rule
 */
enum class CurationStatus {
  Perfect,
  ManuallyValidated,
  ManuallyNotVerified,
  ManuallyInvalidated,
  Unknown
};

/**
 * Parse a curation label (case-insensitive, '-' and ' ' accepted for '_').
 * Accepted: perfect, manually_validated/validated,
 * manually_not_verified/not_verified, manually_invalidated/invalidated,
 * unknown (or empty).
 * @return std::nullopt if the label is not recognised
 */
RDKIT_ROVALIDATOR_EXPORT std::optional<CurationStatus>
curation_status_from_string(const std::string &label);

RDKIT_ROVALIDATOR_EXPORT std::string to_string(CurationStatus status);

/**
 * A reaction operator. The template is opaque to the core and is only
 * interpreted by the chemistry engine.
 */
struct TransformationRule {
  RuleId id = 0;
  std::string rule_template;
  int substrate_arity = 1;  // distinct inputs the rule expects
  int product_arity = 0;    // 0 when not recorded
  CurationStatus curation_status = CurationStatus::Unknown;
  std::string name;
};

enum class ChemicalRole { Substrate, Product };

struct ReactionParticipant {
  ChemicalId id = 0;
  ChemicalRole role = ChemicalRole::Substrate;
  std::optional<int> coefficient;
};

/**
 * Cofactor-free view of one reaction: chemicals with their role and
 * stoichiometric coefficient, in insertion order.
 */
class RDKIT_ROVALIDATOR_EXPORT ObservedReaction {
 public:
  ObservedReaction() = default;
  explicit ObservedReaction(std::int64_t id) : d_id(id) {}

  std::int64_t id() const { return d_id; }

  // Adding an id twice in the same role replaces its coefficient.
  ObservedReaction &add_substrate(ChemicalId id,
                                  std::optional<int> coefficient = 1);
  ObservedReaction &add_product(ChemicalId id,
                                std::optional<int> coefficient = 1);

  std::vector<ChemicalId> substrates() const;
  std::vector<ChemicalId> products() const;

  std::optional<int> substrate_coefficient(ChemicalId id) const;
  std::optional<int> product_coefficient(ChemicalId id) const;

  const std::vector<ReactionParticipant> &participants() const {
    return d_participants;
  }

 private:
  ObservedReaction &add(ChemicalId id, ChemicalRole role,
                        std::optional<int> coefficient);
  std::vector<ChemicalId> ids_with_role(ChemicalRole role) const;
  std::optional<int> coefficient_with_role(ChemicalId id,
                                           ChemicalRole role) const;

  std::int64_t d_id = 0;
  std::vector<ReactionParticipant> d_participants;
};

/**
 * Opaque handle to a molecular structure. `mol` is populated by the RDKit
 * engine and may be null for other engines.
 */
struct Structure {
  std::string source_identifier;
  RDKit::ROMOL_SPTR mol;
};

using ProductSet = std::vector<Structure>;

}  // namespace ro_validator

#endif  // RO_VALIDATOR_TYPES_HPP

#ifndef RO_VALIDATOR_CHEMISTRY_ENGINE_HPP
#define RO_VALIDATOR_CHEMISTRY_ENGINE_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/types.hpp>
#include <string>
#include <vector>

namespace ro_validator {

struct CanonicalOptions {
  bool strip_stereochemistry = true;
};

/**
 * Structure handling and rule projection used by the validator and the
 * seed expander. Implementations report failures by throwing the
 * exceptions named on each method; callers in this module recover from all
 * of them locally.
 */
class RDKIT_ROVALIDATOR_EXPORT ChemistryEngine {
 public:
  virtual ~ChemistryEngine() = default;

  /**
   * Parse a chemical identifier (SMILES or InChI) into a structure.
   * @throws StructureParseError
   */
  virtual Structure parse_structure(const std::string &identifier) = 0;

  /**
   * 2D-clean and aromatize. Applying it twice gives the same structure.
   * @throws StructureParseError if the structure cannot be sanitized
   */
  virtual Structure normalize(const Structure &structure) = 0;

  /**
   * Identifier used for equality comparison of structures.
   * @throws CanonicalizationError
   */
  virtual std::string canonical_identifier(const Structure &structure,
                                           const CanonicalOptions &options) = 0;

  /**
   * Prepare a rule for projection. Called once per rule; implementations
   * may cache the compiled form.
   * @throws ProjectionError with kind InvalidTemplate
   */
  virtual void compile_rule(const TransformationRule &rule) = 0;

  /**
   * Apply a rule to an ordered list of inputs and return up to
   * `max_results` alternative product sets.
   * @throws ProjectionError
   */
  virtual std::vector<ProductSet> project_rule(
      const TransformationRule &rule, const std::vector<Structure> &inputs,
      unsigned int max_results) = 0;

  /**
   * True if `structure` contains the substructure described by `smarts`.
   * @throws StructureParseError if the pattern is invalid
   */
  virtual bool matches_substructure(const Structure &structure,
                                    const std::string &smarts) = 0;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_CHEMISTRY_ENGINE_HPP

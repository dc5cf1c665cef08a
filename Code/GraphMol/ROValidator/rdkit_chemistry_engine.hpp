#ifndef RO_VALIDATOR_RDKIT_CHEMISTRY_ENGINE_HPP
#define RO_VALIDATOR_RDKIT_CHEMISTRY_ENGINE_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/chemistry_engine.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ro_validator {

enum class IdentifierFormat {
  Smiles,  // canonical SMILES
  Inchi    // standard InChI (stereo layers dropped with /SNon)
};

struct RDKitEngineOptions {
  IdentifierFormat identifier_format = IdentifierFormat::Smiles;
  // Sanitize projected products; sets with an unsanitizable member are
  // dropped.
  bool sanitize_products = true;
  // Upper bound on the input orderings tried for one projection.
  unsigned int max_input_orderings = 720;
};

/**
 * ChemistryEngine backed by RDKit. Rule templates are reaction SMARTS;
 * identifiers are SMILES, or InChI when they start with "InChI=".
 */
class RDKIT_ROVALIDATOR_EXPORT RDKitChemistryEngine : public ChemistryEngine {
 public:
  RDKitChemistryEngine();
  explicit RDKitChemistryEngine(const RDKitEngineOptions &options);
  ~RDKitChemistryEngine() override;

  RDKitChemistryEngine(const RDKitChemistryEngine &) = delete;
  RDKitChemistryEngine &operator=(const RDKitChemistryEngine &) = delete;

  Structure parse_structure(const std::string &identifier) override;
  Structure normalize(const Structure &structure) override;
  std::string canonical_identifier(const Structure &structure,
                                   const CanonicalOptions &options) override;
  void compile_rule(const TransformationRule &rule) override;
  std::vector<ProductSet> project_rule(const TransformationRule &rule,
                                       const std::vector<Structure> &inputs,
                                       unsigned int max_results) override;
  bool matches_substructure(const Structure &structure,
                            const std::string &smarts) override;

  // Number of reactant templates of a compiled rule, compiling it if needed.
  unsigned int num_reactant_templates(const TransformationRule &rule);

  const RDKitEngineOptions &options() const;

 private:
  class Impl;
  std::unique_ptr<Impl> pimpl;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_RDKIT_CHEMISTRY_ENGINE_HPP

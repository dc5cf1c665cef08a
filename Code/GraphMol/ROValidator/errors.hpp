#ifndef RO_VALIDATOR_ERRORS_HPP
#define RO_VALIDATOR_ERRORS_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ro_validator {

class RDKIT_ROVALIDATOR_EXPORT ValidatorError : public std::runtime_error {
 public:
  explicit ValidatorError(const std::string &msg) : std::runtime_error(msg) {}
};

// Reference data for the rule corpus is missing or malformed. Fatal to a run.
class RDKIT_ROVALIDATOR_EXPORT CorpusLoadError : public ValidatorError {
 public:
  explicit CorpusLoadError(const std::string &msg) : ValidatorError(msg) {}
};

// No structure identifier is known for a real (non-placeholder) chemical.
// Fatal to the reaction being validated.
class RDKIT_ROVALIDATOR_EXPORT ChemicalResolutionError : public ValidatorError {
 public:
  ChemicalResolutionError(std::int64_t chemical_id, const std::string &msg)
      : ValidatorError(msg), d_chemical_id(chemical_id) {}

  std::int64_t chemical_id() const { return d_chemical_id; }

 private:
  std::int64_t d_chemical_id;
};

// A real substrate or product could not be turned into a comparable
// structure. Fatal to the reaction being validated.
class RDKIT_ROVALIDATOR_EXPORT ReactionProcessingError : public ValidatorError {
 public:
  explicit ReactionProcessingError(const std::string &msg)
      : ValidatorError(msg) {}
};

class RDKIT_ROVALIDATOR_EXPORT StructureParseError : public ValidatorError {
 public:
  explicit StructureParseError(const std::string &msg) : ValidatorError(msg) {}
};

class RDKIT_ROVALIDATOR_EXPORT CanonicalizationError : public ValidatorError {
 public:
  explicit CanonicalizationError(const std::string &msg)
      : ValidatorError(msg) {}
};

enum class ProjectionErrorKind {
  InvalidTemplate,  // the engine cannot compile the rule template
  EngineFailure,    // the engine failed while running the rule
  NoSubstrates      // nothing to project onto
};

RDKIT_ROVALIDATOR_EXPORT std::string to_string(ProjectionErrorKind kind);

class RDKIT_ROVALIDATOR_EXPORT ProjectionError : public ValidatorError {
 public:
  ProjectionError(ProjectionErrorKind kind, const std::string &msg)
      : ValidatorError(msg), d_kind(kind) {}

  ProjectionErrorKind kind() const { return d_kind; }

 private:
  ProjectionErrorKind d_kind;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_ERRORS_HPP

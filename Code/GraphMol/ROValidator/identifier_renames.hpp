#ifndef RO_VALIDATOR_IDENTIFIER_RENAMES_HPP
#define RO_VALIDATOR_IDENTIFIER_RENAMES_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <istream>
#include <string>
#include <unordered_map>

namespace ro_validator {

/**
 * Known-bad chemical identifiers in the knowledge store and the identifiers
 * that should be parsed in their place.
 */
class RDKIT_ROVALIDATOR_EXPORT IdentifierRenames {
 public:
  /**
   * Two columns: wrong_identifier, correct_identifier (CSV or TSV, header
   * row required).
   * @throws CorpusLoadError
   */
  static IdentifierRenames load(const std::string &path);
  static IdentifierRenames load(std::istream &in,
                                const std::string &source_name);

  void add(const std::string &wrong, const std::string &correct);

  std::string rename_if_listed(const std::string &identifier) const;

  std::size_t size() const { return d_renames.size(); }

 private:
  std::unordered_map<std::string, std::string> d_renames;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_IDENTIFIER_RENAMES_HPP

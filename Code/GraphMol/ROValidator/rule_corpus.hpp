#ifndef RO_VALIDATOR_RULE_CORPUS_HPP
#define RO_VALIDATOR_RULE_CORPUS_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/types.hpp>
#include <istream>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace ro_validator {

using RulePtr = std::shared_ptr<const TransformationRule>;

/**
 * Read-only, ordered set of transformation rules. Filters return a new
 * corpus sharing the same rule objects; the receiver is never modified.
 */
class RDKIT_ROVALIDATOR_EXPORT RuleCorpus {
 public:
  RuleCorpus() = default;
  explicit RuleCorpus(std::vector<TransformationRule> rules);

  /**
   * Load rules from a CSV or TSV file with a header row.
   *
   * Columns (case-insensitive):
   *  - id (required)
   *  - rule | ro | smarts (required): the rule template
   *  - substrate_count | substrate_arity (required, > 0)
   *  - curation_status, or the pair category ("perfect") and
   *    manual_validation (true / false / empty)
   *  - product_count | product_arity, name (optional)
   *
   * @throws CorpusLoadError if the file is missing or malformed
   */
  static RuleCorpus load(const std::string &path);
  static RuleCorpus load(std::istream &in, const std::string &source_name);

  const std::vector<RulePtr> &rules() const { return d_rules; }
  std::size_t size() const { return d_rules.size(); }
  bool empty() const { return d_rules.empty(); }

  // Null if no rule has this id.
  RulePtr find(RuleId id) const;

  RuleCorpus filter_by_substrate_arity(int arity) const;
  RuleCorpus filter_by_product_arity(int arity) const;
  RuleCorpus filter_by_curation_status(
      const std::set<CurationStatus> &statuses) const;
  // Ids with no rule in the corpus are ignored; corpus order is kept.
  RuleCorpus filter_by_ids(const std::vector<RuleId> &ids) const;

 private:
  explicit RuleCorpus(std::vector<RulePtr> rules);

  template <typename Pred>
  RuleCorpus filter(Pred pred) const;

  std::vector<RulePtr> d_rules;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_RULE_CORPUS_HPP

#ifndef RO_VALIDATOR_RULE_PROJECTOR_HPP
#define RO_VALIDATOR_RULE_PROJECTOR_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/chemistry_engine.hpp>
#include <GraphMol/ROValidator/errors.hpp>
#include <GraphMol/ROValidator/score.hpp>
#include <GraphMol/ROValidator/types.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ro_validator {

constexpr unsigned int MAX_PROJECTIONS = 10;

struct ProjectorOptions {
  // Candidate product sets kept per projection; the rest are discarded.
  unsigned int max_projections = MAX_PROJECTIONS;
  bool strip_stereochemistry = true;
};

struct ProjectionFailure {
  ProjectionErrorKind kind;
  std::string message;
};

/**
 * Candidate product sets of one rule on one substrate multiset, or the
 * reason none could be produced.
 */
struct ProjectionResult {
  std::vector<ProductSet> product_sets;
  std::optional<ProjectionFailure> failure;

  bool ok() const { return !failure.has_value(); }
};

struct ProjectorStats {
  std::size_t projections = 0;
  std::size_t projection_failures = 0;
  std::size_t canonicalization_failures = 0;
};

/**
 * Applies single rules through a ChemistryEngine and scores the outcome
 * against an expected product set. Chemistry failures never propagate out
 * of this class.
 */
class RDKIT_ROVALIDATOR_EXPORT RuleProjector {
 public:
  explicit RuleProjector(ChemistryEngine &engine,
                         const ProjectorOptions &options = ProjectorOptions());

  /**
   * Project `rule` onto the ordered substrates, keeping at most
   * max_projections product sets.
   */
  ProjectionResult project(const TransformationRule &rule,
                           const std::vector<Structure> &substrates);

  /**
   * Match if any structure of any of the first max_projections candidate
   * sets has a comparison identifier in `expected`. A match scores
   * curation_score(rule.curation_status).
   */
  ScoreVerdict score(const TransformationRule &rule,
                     const std::vector<ProductSet> &candidate_sets,
                     const std::set<std::string> &expected);

  /**
   * project() then score(); a failed projection is logged under
   * `context` and scores Unmatch.
   */
  ScoreVerdict project_and_score(const TransformationRule &rule,
                                 const std::vector<Structure> &substrates,
                                 const std::set<std::string> &expected,
                                 const std::string &context = "");

  /**
   * Normalized, stereo-stripped identifier used for product comparison.
   * @throws CanonicalizationError
   */
  std::string comparison_identifier(const Structure &structure);

  const ProjectorOptions &options() const { return d_options; }
  const ProjectorStats &stats() const { return d_stats; }
  ChemistryEngine &engine() { return d_engine; }

 private:
  ChemistryEngine &d_engine;
  ProjectorOptions d_options;
  ProjectorStats d_stats;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_RULE_PROJECTOR_HPP

#ifndef RO_VALIDATOR_REACTION_VALIDATOR_HPP
#define RO_VALIDATOR_REACTION_VALIDATOR_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/chemistry_engine.hpp>
#include <GraphMol/ROValidator/composition_cache.hpp>
#include <GraphMol/ROValidator/composition_key.hpp>
#include <GraphMol/ROValidator/identifier_renames.hpp>
#include <GraphMol/ROValidator/knowledge_store.hpp>
#include <GraphMol/ROValidator/rule_corpus.hpp>
#include <GraphMol/ROValidator/rule_projector.hpp>
#include <GraphMol/ROValidator/score.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace ro_validator {

struct ValidatorOptions {
  ProjectorOptions projector;
  // Identifiers containing this marker denote non-physical placeholder
  // chemicals, which are left out of validation. Empty disables the check.
  std::string placeholder_marker = "FAKE";
  CoefficientPolicy product_coefficient_policy =
      CoefficientPolicy::SubstrateAccessor;
  // Used for substrates recorded without a usable coefficient.
  int default_coefficient = 1;
  // Larger substrate coefficients fail the reaction as corrupt data.
  int max_coefficient = 100;
};

enum class ValidationStatus { Scored, Failed };

enum class FailureKind {
  None,
  ChemicalResolution,  // a real chemical has no structure identifier
  Processing,          // a real substrate/product could not be used
  Other
};

/**
 * Result of one reaction in a batch. A Scored outcome with an empty ranking
 * means no rule matched; Failed means the reaction could not be validated.
 */
struct ValidationOutcome {
  std::int64_t reaction_id = 0;
  ValidationStatus status = ValidationStatus::Failed;
  ScoreRankingPtr ranking;  // set iff status == Scored
  FailureKind failure = FailureKind::None;
  std::string error;

  bool scored() const { return status == ValidationStatus::Scored; }
};

struct ValidatorStats {
  std::size_t reactions_validated = 0;
  std::size_t cache_hits = 0;
  std::size_t reactions_matched = 0;  // at least one rule matched
  std::size_t reactions_failed = 0;
};

/**
 * Scores observed reactions against every rule of a corpus. Results are
 * cached by reaction composition for the lifetime of the validator, so one
 * validator must not be reused with a different corpus.
 *
 * The engine and the knowledge store must outlive the validator.
 */
class RDKIT_ROVALIDATOR_EXPORT ReactionValidator {
 public:
  ReactionValidator(const RuleCorpus &corpus, ChemistryEngine &engine,
                    const KnowledgeStore &store,
                    const ValidatorOptions &options = ValidatorOptions(),
                    const IdentifierRenames *renames = nullptr);

  /**
   * Rank the rules that explain `reaction`. Reactions with the same
   * composition get the identical cached ranking object.
   *
   * @throws ChemicalResolutionError if a real chemical has no identifier
   * @throws ReactionProcessingError if a real substrate or product cannot
   *         be parsed or canonicalized, or a substrate coefficient exceeds
   *         max_coefficient
   */
  ScoreRankingPtr validate(const ObservedReaction &reaction);

  /**
   * Read the reaction from the knowledge store and validate it.
   * @return null if the store has no such reaction
   */
  ScoreRankingPtr validate_one_reaction(std::int64_t reaction_id);

  /**
   * Validate every reaction; failures are recorded per reaction and never
   * stop the batch.
   */
  std::vector<ValidationOutcome> validate_batch(
      const std::vector<ObservedReaction> &reactions);

  CompositionKey composition_key(const ObservedReaction &reaction) const;

  /**
   * Normalized substrate structures, each repeated by its coefficient.
   * Placeholder chemicals are skipped.
   */
  std::vector<Structure> substrate_multiset(const ObservedReaction &reaction);

  /**
   * Comparison identifiers of the real products.
   */
  std::set<std::string> expected_products(const ObservedReaction &reaction);

  const ValidatorStats &stats() const { return d_stats; }
  void log_summary() const;

  const CompositionCache &cache() const { return d_cache; }
  const RuleCorpus &corpus() const { return d_corpus; }
  const RuleProjector &projector() const { return d_projector; }

 private:
  // Empty if the chemical is a placeholder.
  std::optional<std::string> resolve_identifier(ChemicalId id) const;
  Structure prepared_structure(ChemicalId id, const std::string &identifier);

  RuleCorpus d_corpus;
  ChemistryEngine &d_engine;
  const KnowledgeStore &d_store;
  ValidatorOptions d_options;
  const IdentifierRenames *d_renames;
  RuleProjector d_projector;
  CompositionCache d_cache;
  std::unordered_set<RuleId> d_uncompiled_rules;
  ValidatorStats d_stats;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_REACTION_VALIDATOR_HPP

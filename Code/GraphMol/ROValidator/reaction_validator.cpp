#include "reaction_validator.hpp"
#include "errors.hpp"

#include <RDGeneral/RDLog.h>

#include <memory>

namespace ro_validator {

ReactionValidator::ReactionValidator(const RuleCorpus &corpus,
                                     ChemistryEngine &engine,
                                     const KnowledgeStore &store,
                                     const ValidatorOptions &options,
                                     const IdentifierRenames *renames)
    : d_corpus(corpus),
      d_engine(engine),
      d_store(store),
      d_options(options),
      d_renames(renames),
      d_projector(engine, options.projector) {
  for (const auto &rule : d_corpus.rules()) {
    try {
      d_engine.compile_rule(*rule);
    } catch (const std::exception &e) {
      BOOST_LOG(rdErrorLog) << "Rule " << rule->id
                            << " cannot be compiled and will never match: "
                            << e.what() << std::endl;
      d_uncompiled_rules.insert(rule->id);
    }
  }
}

CompositionKey ReactionValidator::composition_key(
    const ObservedReaction &reaction) const {
  return make_composition_key(reaction, d_options.product_coefficient_policy);
}

std::optional<std::string> ReactionValidator::resolve_identifier(
    ChemicalId id) const {
  auto identifier = d_store.read_chemical_structure_identifier(id);
  if (!identifier) {
    const std::string msg =
        "Missing structure identifier for chemical " + std::to_string(id);
    BOOST_LOG(rdErrorLog) << msg << std::endl;
    throw ChemicalResolutionError(id, msg);
  }
  if (!d_options.placeholder_marker.empty() &&
      identifier->find(d_options.placeholder_marker) != std::string::npos) {
    BOOST_LOG(rdDebugLog) << "Chemical " << id
                          << " is a placeholder, ignoring it" << std::endl;
    return std::nullopt;
  }
  return identifier;
}

Structure ReactionValidator::prepared_structure(ChemicalId id,
                                                const std::string &identifier) {
  const std::string to_parse =
      d_renames ? d_renames->rename_if_listed(identifier) : identifier;
  try {
    return d_engine.normalize(d_engine.parse_structure(to_parse));
  } catch (const std::exception &e) {
    BOOST_LOG(rdErrorLog) << "Error occurred while trying to import "
                          << to_parse << ": " << e.what() << std::endl;
    throw ReactionProcessingError("Cannot import chemical " +
                                  std::to_string(id) + " (" + to_parse +
                                  "): " + e.what());
  }
}

std::vector<Structure> ReactionValidator::substrate_multiset(
    const ObservedReaction &reaction) {
  std::vector<Structure> res;
  for (const auto id : reaction.substrates()) {
    auto identifier = resolve_identifier(id);
    if (!identifier) {
      continue;
    }
    const auto structure = prepared_structure(id, *identifier);

    // Some rules need several copies of one substrate.
    auto coefficient = reaction.substrate_coefficient(id);
    if (!coefficient || *coefficient <= 0) {
      BOOST_LOG(rdWarningLog)
          << "Converting coefficient "
          << (coefficient ? std::to_string(*coefficient) : "null") << " -> "
          << d_options.default_coefficient << " for rxn " << reaction.id()
          << "/chem " << id << std::endl;
      coefficient = d_options.default_coefficient;
    }
    if (*coefficient > d_options.max_coefficient) {
      throw ReactionProcessingError(
          "Coefficient " + std::to_string(*coefficient) + " of chemical " +
          std::to_string(id) + " in reaction " +
          std::to_string(reaction.id()) + " exceeds " +
          std::to_string(d_options.max_coefficient));
    }
    res.insert(res.end(), static_cast<std::size_t>(*coefficient), structure);
  }
  return res;
}

std::set<std::string> ReactionValidator::expected_products(
    const ObservedReaction &reaction) {
  std::set<std::string> res;
  for (const auto id : reaction.products()) {
    auto identifier = resolve_identifier(id);
    if (!identifier) {
      continue;
    }
    const auto structure = prepared_structure(id, *identifier);
    try {
      res.insert(d_projector.comparison_identifier(structure));
    } catch (const std::exception &e) {
      throw ReactionProcessingError("Cannot canonicalize product " +
                                    std::to_string(id) + " of reaction " +
                                    std::to_string(reaction.id()) + ": " +
                                    e.what());
    }
  }
  return res;
}

ScoreRankingPtr ReactionValidator::validate(const ObservedReaction &reaction) {
  ++d_stats.reactions_validated;
  const auto key = composition_key(reaction);

  // Only valid while rules ignore cofactors.
  if (auto cached = d_cache.find(key)) {
    BOOST_LOG(rdDebugLog) << "Got hit on cached results: " << reaction.id()
                          << " == " << cached->first_reaction_id
                          << std::endl;
    ++d_stats.cache_hits;
    if (!cached->ranking->empty()) {
      ++d_stats.reactions_matched;
    }
    return cached->ranking;
  }

  std::vector<Structure> substrates;
  std::set<std::string> expected;
  try {
    substrates = substrate_multiset(reaction);
    expected = expected_products(reaction);
  } catch (const ValidatorError &) {
    ++d_stats.reactions_failed;
    throw;
  }

  auto ranking = std::make_shared<ScoreRanking>();
  if (substrates.empty()) {
    BOOST_LOG(rdWarningLog) << "Reaction " << reaction.id()
                            << " has no real substrates, no rule can match"
                            << std::endl;
  } else {
    const std::string context = "reaction " + std::to_string(reaction.id());
    for (const auto &rule : d_corpus.rules()) {
      if (d_uncompiled_rules.count(rule->id)) {
        continue;
      }
      const auto verdict =
          d_projector.project_and_score(*rule, substrates, expected, context);
      if (verdict.matched && verdict.score > UNMATCH_SCORE) {
        ranking->add(verdict.score, rule->id);
      }
    }
  }

  if (!ranking->empty()) {
    ++d_stats.reactions_matched;
  }
  // Cache results for any future reaction with the same composition.
  return d_cache
      .insert_if_absent(key, reaction.id(), std::move(ranking))
      .ranking;
}

ScoreRankingPtr ReactionValidator::validate_one_reaction(
    std::int64_t reaction_id) {
  auto reaction = d_store.read_reaction(reaction_id);
  if (!reaction) {
    BOOST_LOG(rdErrorLog) << "Could not find reaction " << reaction_id
                          << " in the knowledge store" << std::endl;
    return ScoreRankingPtr();
  }
  return validate(*reaction);
}

std::vector<ValidationOutcome> ReactionValidator::validate_batch(
    const std::vector<ObservedReaction> &reactions) {
  std::vector<ValidationOutcome> res;
  res.reserve(reactions.size());
  for (const auto &reaction : reactions) {
    ValidationOutcome outcome;
    outcome.reaction_id = reaction.id();
    try {
      outcome.ranking = validate(reaction);
      outcome.status = ValidationStatus::Scored;
    } catch (const ChemicalResolutionError &e) {
      outcome.failure = FailureKind::ChemicalResolution;
      outcome.error = e.what();
    } catch (const ReactionProcessingError &e) {
      outcome.failure = FailureKind::Processing;
      outcome.error = e.what();
    } catch (const std::exception &e) {
      outcome.failure = FailureKind::Other;
      outcome.error = e.what();
    }
    if (!outcome.scored()) {
      BOOST_LOG(rdErrorLog) << "Validation of reaction " << reaction.id()
                            << " failed: " << outcome.error << std::endl;
    }
    res.push_back(std::move(outcome));
  }
  return res;
}

void ReactionValidator::log_summary() const {
  BOOST_LOG(rdInfoLog) << "Validated " << d_stats.reactions_validated
                       << " reactions against " << d_corpus.size()
                       << " rules" << std::endl;
  BOOST_LOG(rdInfoLog) << "Found " << d_stats.reactions_matched
                       << " reactions that matched at least one rule"
                       << std::endl;
  BOOST_LOG(rdInfoLog) << "Observed " << d_stats.cache_hits
                       << " projection cache hits based on substrates/products"
                       << std::endl;
  if (d_stats.reactions_failed) {
    BOOST_LOG(rdInfoLog) << d_stats.reactions_failed
                         << " reactions could not be validated" << std::endl;
  }
}

}  // namespace ro_validator

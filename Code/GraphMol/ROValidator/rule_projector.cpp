#include "rule_projector.hpp"

#include <RDGeneral/RDLog.h>

namespace ro_validator {

RuleProjector::RuleProjector(ChemistryEngine &engine,
                             const ProjectorOptions &options)
    : d_engine(engine), d_options(options) {}

ProjectionResult RuleProjector::project(
    const TransformationRule &rule, const std::vector<Structure> &substrates) {
  ProjectionResult res;
  ++d_stats.projections;
  if (substrates.empty()) {
    ++d_stats.projection_failures;
    res.failure = ProjectionFailure{ProjectionErrorKind::NoSubstrates,
                                    "Rule " + std::to_string(rule.id) +
                                        ": no substrates to project onto"};
    return res;
  }

  try {
    res.product_sets =
        d_engine.project_rule(rule, substrates, d_options.max_projections);
  } catch (const ProjectionError &e) {
    ++d_stats.projection_failures;
    res.failure = ProjectionFailure{e.kind(), e.what()};
    return res;
  } catch (const std::exception &e) {
    ++d_stats.projection_failures;
    res.failure = ProjectionFailure{ProjectionErrorKind::EngineFailure,
                                    e.what()};
    return res;
  }

  // engines are not trusted to honour the cap
  if (res.product_sets.size() > d_options.max_projections) {
    res.product_sets.resize(d_options.max_projections);
  }
  return res;
}

std::string RuleProjector::comparison_identifier(const Structure &structure) {
  Structure normalized;
  try {
    normalized = d_engine.normalize(structure);
  } catch (const CanonicalizationError &) {
    throw;
  } catch (const std::exception &e) {
    throw CanonicalizationError(e.what());
  }
  CanonicalOptions opts;
  opts.strip_stereochemistry = d_options.strip_stereochemistry;
  return d_engine.canonical_identifier(normalized, opts);
}

ScoreVerdict RuleProjector::score(const TransformationRule &rule,
                                  const std::vector<ProductSet> &candidate_sets,
                                  const std::set<std::string> &expected) {
  if (expected.empty()) {
    return ScoreVerdict::unmatch();
  }

  std::size_t n_sets = 0;
  for (const auto &products : candidate_sets) {
    if (n_sets++ >= d_options.max_projections) {
      break;
    }
    // One matching structure is enough for the rule to explain the
    // reaction.
    for (const auto &product : products) {
      std::string id;
      try {
        id = comparison_identifier(product);
      } catch (const std::exception &e) {
        ++d_stats.canonicalization_failures;
        BOOST_LOG(rdErrorLog)
            << "Unable to export projected product of rule " << rule.id
            << ", skipping: " << e.what() << std::endl;
        continue;
      }
      if (expected.count(id)) {
        return ScoreVerdict::match(curation_score(rule.curation_status));
      }
    }
  }
  return ScoreVerdict::unmatch();
}

ScoreVerdict RuleProjector::project_and_score(
    const TransformationRule &rule, const std::vector<Structure> &substrates,
    const std::set<std::string> &expected, const std::string &context) {
  auto projection = project(rule, substrates);
  if (!projection.ok()) {
    BOOST_LOG(rdErrorLog) << "Projection of rule " << rule.id
                          << (context.empty() ? "" : " onto ") << context
                          << " failed ("
                          << to_string(projection.failure->kind)
                          << "): " << projection.failure->message
                          << std::endl;
    return ScoreVerdict::unmatch();
  }
  if (projection.product_sets.empty()) {
    BOOST_LOG(rdDebugLog) << "No products were generated by rule " << rule.id
                          << std::endl;
    return ScoreVerdict::unmatch();
  }
  return score(rule, projection.product_sets, expected);
}

}  // namespace ro_validator

#include "seed_expander.hpp"

#include <RDGeneral/RDLog.h>

#include <utility>

namespace ro_validator {

SeedSequence::SeedSequence(RuleCorpus rules, std::vector<Structure> molecules,
                           ChemistryEngine &engine)
    : d_rules(std::move(rules)),
      d_molecules(std::move(molecules)),
      d_engine(&engine) {}

SeedSequence::iterator::iterator(const SeedSequence *seq) : d_seq(seq) {
  settle();
}

SeedSequence::iterator &SeedSequence::iterator::operator++() {
  if (!d_seq) {
    return *this;
  }
  if (++d_mol >= d_seq->d_molecules.size()) {
    ++d_rule;
    d_mol = 0;
  }
  settle();
  return *this;
}

// Moves forward to the next valid (rule, molecule) pair, or to end().
// A rule is compiled when its first molecule is reached.
void SeedSequence::iterator::settle() {
  const auto &rules = d_seq->d_rules.rules();
  if (d_seq->d_molecules.empty()) {
    d_rule = rules.size();
  }
  while (d_rule < rules.size()) {
    const auto &rule = rules[d_rule];
    if (d_mol == 0) {
      try {
        d_seq->d_engine->compile_rule(*rule);
      } catch (const std::exception &e) {
        BOOST_LOG(rdInfoLog) << "Skipping rule " << rule->id
                             << ", couldn't compile it: " << e.what()
                             << std::endl;
        ++d_rule;
        continue;
      }
    }
    d_current.rule_id = std::to_string(rule->id);
    d_current.substrates = {d_seq->d_molecules[d_mol]};
    d_current.rule = rule;
    d_current.sar.reset();
    return;
  }
  *this = iterator();
}

std::vector<PredictionSeed> SeedSequence::materialize() const {
  std::vector<PredictionSeed> res;
  res.reserve(max_size());
  for (const auto &seed : *this) {
    res.push_back(seed);
  }
  return res;
}

SingleSubstrateSeedExpander::SingleSubstrateSeedExpander(
    const RuleCorpus &corpus, std::vector<Structure> molecules,
    ChemistryEngine &engine)
    : d_corpus(corpus.filter_by_substrate_arity(1)),
      d_molecules(std::move(molecules)),
      d_engine(engine) {}

SeedSequence SingleSubstrateSeedExpander::seeds() const {
  return SeedSequence(d_corpus, d_molecules, d_engine);
}

std::vector<PredictionSeed> SingleSubstrateSeedExpander::materialize() const {
  const auto res = seeds().materialize();
  BOOST_LOG(rdInfoLog) << "Created " << res.size() << " prediction seeds"
                       << std::endl;
  return res;
}

PredictionGenerator::PredictionGenerator(RuleProjector &projector)
    : d_projector(projector) {}

bool PredictionGenerator::passes_sar(const PredictionSeed &seed) {
  if (!seed.sar) {
    return true;
  }
  for (const auto &substrate : seed.substrates) {
    try {
      if (!d_projector.engine().matches_substructure(
              substrate, seed.sar->substructure_smarts)) {
        return false;
      }
    } catch (const std::exception &e) {
      BOOST_LOG(rdWarningLog) << "SAR check failed for rule " << seed.rule_id
                              << ": " << e.what() << std::endl;
      return false;
    }
  }
  return true;
}

std::string PredictionGenerator::identifier_or_source(
    const Structure &structure) {
  try {
    return d_projector.comparison_identifier(structure);
  } catch (const std::exception &) {
    return structure.source_identifier;
  }
}

std::vector<Prediction> PredictionGenerator::generate(
    const PredictionSeed &seed, int first_id) {
  std::vector<Prediction> res;
  if (!seed.rule || !passes_sar(seed)) {
    return res;
  }

  const auto projection = d_projector.project(*seed.rule, seed.substrates);
  if (!projection.ok()) {
    BOOST_LOG(rdDebugLog) << "Rule " << seed.rule_id
                          << " produced no prediction: "
                          << projection.failure->message << std::endl;
    return res;
  }

  std::vector<std::string> substrate_ids;
  for (const auto &substrate : seed.substrates) {
    substrate_ids.push_back(identifier_or_source(substrate));
  }

  for (const auto &products : projection.product_sets) {
    Prediction pred;
    bool valid = true;
    for (const auto &product : products) {
      try {
        pred.product_identifiers.push_back(
            d_projector.comparison_identifier(product));
      } catch (const std::exception &e) {
        BOOST_LOG(rdWarningLog) << "Dropping product set of rule "
                                << seed.rule_id << ": " << e.what()
                                << std::endl;
        valid = false;
        break;
      }
    }
    if (!valid) {
      continue;
    }
    pred.id = first_id + static_cast<int>(res.size());
    pred.rule_id = seed.rule_id;
    pred.substrate_identifiers = substrate_ids;
    res.push_back(std::move(pred));
  }
  return res;
}

std::set<std::string> unique_product_identifiers(
    const std::vector<Prediction> &predictions) {
  std::set<std::string> res;
  for (const auto &pred : predictions) {
    res.insert(pred.product_identifiers.begin(),
               pred.product_identifiers.end());
  }
  return res;
}

}  // namespace ro_validator

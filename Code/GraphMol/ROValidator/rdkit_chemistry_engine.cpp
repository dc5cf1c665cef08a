#include "rdkit_chemistry_engine.hpp"
#include "errors.hpp"

#include <GraphMol/ChemReactions/Reaction.h>
#include <GraphMol/ChemReactions/ReactionParser.h>
#include <GraphMol/Depictor/RDDepictor.h>
#include <GraphMol/GraphMol.h>
#include <GraphMol/MolOps.h>
#include <GraphMol/ROMol.h>
#include <GraphMol/RWMol.h>
#include <GraphMol/SmilesParse/SmilesParse.h>
#include <GraphMol/SmilesParse/SmilesWrite.h>
#include <GraphMol/Substruct/SubstructMatch.h>
#include <INCHI-API/inchi.h>
#include <RDGeneral/RDLog.h>

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <utility>

namespace ro_validator {

namespace {
const std::string INCHI_PREFIX = "InChI=";
// Drop every stereo layer from the InChI.
const char *INCHI_NO_STEREO_OPTIONS = "/SNon";

bool is_inchi(const std::string &identifier) {
  return identifier.compare(0, INCHI_PREFIX.size(), INCHI_PREFIX) == 0;
}

const RDKit::ROMol &require_mol(const Structure &structure) {
  if (!structure.mol) {
    throw StructureParseError("Structure '" + structure.source_identifier +
                              "' carries no molecule");
  }
  return *structure.mol;
}
}  // namespace

/**
 * Private implementation class (PIMPL pattern)
 */
class RDKitChemistryEngine::Impl {
 public:
  using ReactionPtr = std::shared_ptr<RDKit::ChemicalReaction>;

  explicit Impl(const RDKitEngineOptions &opts) : options(opts) {}

  RDKitEngineOptions options;
  std::mutex reactions_mutex;
  // keyed on the template too: ids are only unique within one corpus
  std::map<std::pair<RuleId, std::string>, ReactionPtr> reactions;

  ReactionPtr compiled_reaction(const TransformationRule &rule) {
    auto key = std::make_pair(rule.id, rule.rule_template);
    {
      std::lock_guard<std::mutex> lock(reactions_mutex);
      auto it = reactions.find(key);
      if (it != reactions.end()) {
        return it->second;
      }
    }

    ReactionPtr rxn;
    try {
      rxn.reset(RDKit::RxnSmartsToChemicalReaction(rule.rule_template));
    } catch (const std::exception &e) {
      throw ProjectionError(ProjectionErrorKind::InvalidTemplate,
                            "Rule " + std::to_string(rule.id) +
                                ": cannot parse template '" +
                                rule.rule_template + "': " + e.what());
    }
    if (!rxn) {
      throw ProjectionError(ProjectionErrorKind::InvalidTemplate,
                            "Rule " + std::to_string(rule.id) +
                                ": cannot parse template '" +
                                rule.rule_template + "'");
    }
    if (rxn->getNumReactantTemplates() == 0) {
      throw ProjectionError(ProjectionErrorKind::InvalidTemplate,
                            "Rule " + std::to_string(rule.id) +
                                " has no reactant templates");
    }
    try {
      rxn->initReactantMatchers();
    } catch (const std::exception &e) {
      throw ProjectionError(ProjectionErrorKind::InvalidTemplate,
                            "Rule " + std::to_string(rule.id) +
                                ": cannot initialise reactant matchers: " +
                                e.what());
    }

    std::lock_guard<std::mutex> lock(reactions_mutex);
    return reactions.emplace(std::move(key), rxn).first->second;
  }

  // Sanitized copy of a projected product, or null if RDKit rejects it.
  RDKit::ROMOL_SPTR finish_product(const RDKit::ROMOL_SPTR &product) {
    if (!options.sanitize_products) {
      product->updatePropertyCache(false);
      return product;
    }
    try {
      // sanitizeMol needs an RWMol: sanitize via a copy.
      RDKit::RWMol rw(*product);
      RDKit::MolOps::sanitizeMol(rw);
      return RDKit::ROMOL_SPTR(new RDKit::ROMol(rw));
    } catch (const std::exception &e) {
      BOOST_LOG(rdWarningLog)
          << "[project_rule] dropping invalid product: " << e.what()
          << std::endl;
    }
    return RDKit::ROMOL_SPTR();
  }

  /**
   * Every distinct ordering of the inputs, identical structures being
   * interchangeable. Bounded by options.max_input_orderings.
   */
  std::vector<std::vector<std::size_t>> input_orderings(
      const std::vector<Structure> &inputs) {
    std::vector<std::string> smiles;
    smiles.reserve(inputs.size());
    for (const auto &s : inputs) {
      smiles.push_back(RDKit::MolToSmiles(require_mol(s)));
    }

    // class ids: index of the first input with the same SMILES
    std::vector<std::size_t> classes(inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i) {
      classes[i] = static_cast<std::size_t>(
          std::find(smiles.begin(), smiles.end(), smiles[i]) - smiles.begin());
    }
    std::vector<std::size_t> order = classes;
    std::sort(order.begin(), order.end());

    std::vector<std::vector<std::size_t>> res;
    do {
      // map each class slot back to a concrete input index
      std::vector<std::size_t> used(inputs.size(), 0);
      std::vector<std::size_t> perm;
      perm.reserve(order.size());
      for (const auto cls : order) {
        std::size_t seen = 0;
        for (std::size_t i = 0; i < inputs.size(); ++i) {
          if (classes[i] == cls && seen++ == used[cls]) {
            perm.push_back(i);
            ++used[cls];
            break;
          }
        }
      }
      res.push_back(std::move(perm));
      if (res.size() >= options.max_input_orderings) {
        break;
      }
    } while (std::next_permutation(order.begin(), order.end()));
    return res;
  }
};

RDKitChemistryEngine::RDKitChemistryEngine()
    : pimpl(std::make_unique<Impl>(RDKitEngineOptions())) {}

RDKitChemistryEngine::RDKitChemistryEngine(const RDKitEngineOptions &options)
    : pimpl(std::make_unique<Impl>(options)) {}

RDKitChemistryEngine::~RDKitChemistryEngine() = default;

const RDKitEngineOptions &RDKitChemistryEngine::options() const {
  return pimpl->options;
}

Structure RDKitChemistryEngine::parse_structure(const std::string &identifier) {
  if (identifier.empty()) {
    throw StructureParseError("Empty chemical identifier");
  }

  std::unique_ptr<RDKit::ROMol> mol;
  try {
    if (is_inchi(identifier)) {
      RDKit::ExtraInchiReturnValues rv;
      mol.reset(RDKit::InchiToMol(identifier, rv));
    } else {
      mol.reset(RDKit::SmilesToMol(identifier));
    }
  } catch (const std::exception &e) {
    throw StructureParseError("Failed to parse '" + identifier +
                              "': " + e.what());
  }
  if (!mol) {
    throw StructureParseError("Failed to parse '" + identifier + "'");
  }
  return Structure{identifier, RDKit::ROMOL_SPTR(mol.release())};
}

Structure RDKitChemistryEngine::normalize(const Structure &structure) {
  const auto &mol = require_mol(structure);
  try {
    auto rw = std::make_unique<RDKit::RWMol>(mol);
    RDKit::MolOps::sanitizeMol(*rw);
    // aliphatic rules must not match aromatic compounds
    RDKit::MolOps::setAromaticity(*rw);
    RDDepict::compute2DCoords(*rw);
    return Structure{structure.source_identifier,
                     RDKit::ROMOL_SPTR(new RDKit::ROMol(*rw))};
  } catch (const std::exception &e) {
    throw StructureParseError("Failed to normalize '" +
                              structure.source_identifier + "': " + e.what());
  }
}

std::string RDKitChemistryEngine::canonical_identifier(
    const Structure &structure, const CanonicalOptions &options) {
  if (!structure.mol) {
    throw CanonicalizationError("Structure '" + structure.source_identifier +
                                "' carries no molecule");
  }

  std::string res;
  try {
    if (pimpl->options.identifier_format == IdentifierFormat::Inchi) {
      RDKit::ExtraInchiReturnValues rv;
      res = RDKit::MolToInchi(
          *structure.mol, rv,
          options.strip_stereochemistry ? INCHI_NO_STEREO_OPTIONS : nullptr);
    } else {
      res = RDKit::MolToSmiles(*structure.mol,
                               !options.strip_stereochemistry);
    }
  } catch (const std::exception &e) {
    throw CanonicalizationError("Failed to export '" +
                                structure.source_identifier +
                                "': " + e.what());
  }
  if (res.empty()) {
    throw CanonicalizationError("Failed to export '" +
                                structure.source_identifier + "'");
  }
  return res;
}

void RDKitChemistryEngine::compile_rule(const TransformationRule &rule) {
  pimpl->compiled_reaction(rule);
}

unsigned int RDKitChemistryEngine::num_reactant_templates(
    const TransformationRule &rule) {
  return pimpl->compiled_reaction(rule)->getNumReactantTemplates();
}

std::vector<ProductSet> RDKitChemistryEngine::project_rule(
    const TransformationRule &rule, const std::vector<Structure> &inputs,
    unsigned int max_results) {
  if (inputs.empty()) {
    throw ProjectionError(ProjectionErrorKind::NoSubstrates,
                          "Rule " + std::to_string(rule.id) +
                              ": no substrates to project onto");
  }
  auto rxn = pimpl->compiled_reaction(rule);
  if (rxn->getNumReactantTemplates() != inputs.size()) {
    throw ProjectionError(
        ProjectionErrorKind::EngineFailure,
        "Rule " + std::to_string(rule.id) + " expects " +
            std::to_string(rxn->getNumReactantTemplates()) +
            " reactants, got " + std::to_string(inputs.size()));
  }

  std::vector<ProductSet> res;
  std::set<std::vector<std::string>> seen_sets;
  try {
    for (const auto &perm : pimpl->input_orderings(inputs)) {
      if (res.size() >= max_results) {
        break;
      }
      RDKit::MOL_SPTR_VECT reactants;
      for (const auto idx : perm) {
        reactants.push_back(inputs[idx].mol);
      }

      const auto product_sets = rxn->runReactants(
          reactants, max_results - static_cast<unsigned int>(res.size()));
      for (const auto &prods : product_sets) {
        ProductSet product_set;
        std::vector<std::string> set_key;
        bool valid = true;
        for (const auto &prod : prods) {
          auto finished = pimpl->finish_product(prod);
          if (!finished) {
            valid = false;
            break;
          }
          std::string smiles = RDKit::MolToSmiles(*finished);
          set_key.push_back(smiles);
          product_set.push_back(Structure{std::move(smiles), finished});
        }
        if (!valid) {
          continue;
        }
        std::sort(set_key.begin(), set_key.end());
        if (!seen_sets.insert(set_key).second) {
          continue;
        }
        res.push_back(std::move(product_set));
        if (res.size() >= max_results) {
          break;
        }
      }
    }
  } catch (const ValidatorError &) {
    throw;
  } catch (const std::exception &e) {
    throw ProjectionError(ProjectionErrorKind::EngineFailure,
                          "Rule " + std::to_string(rule.id) +
                              ": projection failed: " + e.what());
  }
  return res;
}

bool RDKitChemistryEngine::matches_substructure(const Structure &structure,
                                                const std::string &smarts) {
  const auto &mol = require_mol(structure);
  std::unique_ptr<RDKit::RWMol> query;
  try {
    query.reset(RDKit::SmartsToMol(smarts));
  } catch (const std::exception &e) {
    throw StructureParseError("Invalid SMARTS '" + smarts + "': " + e.what());
  }
  if (!query) {
    throw StructureParseError("Invalid SMARTS '" + smarts + "'");
  }
  RDKit::MatchVectType match;
  return RDKit::SubstructMatch(mol, *query, match);
}

}  // namespace ro_validator

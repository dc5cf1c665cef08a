#ifndef RO_VALIDATOR_TEST_STUB_ENGINE_HPP
#define RO_VALIDATOR_TEST_STUB_ENGINE_HPP

#include <GraphMol/ROValidator/chemistry_engine.hpp>
#include <GraphMol/ROValidator/errors.hpp>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ro_validator {
namespace testing {

/**
 * Scripted engine for unit tests. Structures carry no molecule; an
 * identifier is its own canonical form. Projection outputs are set per rule,
 * optionally per input list (identifiers joined with '.').
 */
class StubEngine : public ChemistryEngine {
 public:
  using Sets = std::vector<std::vector<std::string>>;

  Structure parse_structure(const std::string &identifier) override {
    ++parse_calls;
    if (identifier.empty() || unparsable.count(identifier)) {
      throw StructureParseError("cannot parse '" + identifier + "'");
    }
    return Structure{identifier, nullptr};
  }

  Structure normalize(const Structure &structure) override {
    return structure;
  }

  std::string canonical_identifier(const Structure &structure,
                                   const CanonicalOptions &) override {
    if (uncanonicalizable.count(structure.source_identifier)) {
      throw CanonicalizationError("cannot export '" +
                                  structure.source_identifier + "'");
    }
    return structure.source_identifier;
  }

  void compile_rule(const TransformationRule &rule) override {
    ++compile_calls[rule.id];
    if (rule.rule_template.find(">>") == std::string::npos) {
      throw ProjectionError(ProjectionErrorKind::InvalidTemplate,
                            "malformed template '" + rule.rule_template + "'");
    }
  }

  std::vector<ProductSet> project_rule(const TransformationRule &rule,
                                       const std::vector<Structure> &inputs,
                                       unsigned int) override {
    ++project_calls[rule.id];
    ++total_project_calls;
    std::string joined;
    for (const auto &s : inputs) {
      joined += (joined.empty() ? "" : ".") + s.source_identifier;
    }
    last_inputs[rule.id] = joined;

    auto failure = failures.find(rule.id);
    if (failure != failures.end()) {
      throw ProjectionError(failure->second, "scripted failure");
    }
    const Sets *sets = nullptr;
    auto keyed = outputs_for_inputs.find(std::make_pair(rule.id, joined));
    if (keyed != outputs_for_inputs.end()) {
      sets = &keyed->second;
    } else {
      auto any = outputs.find(rule.id);
      if (any != outputs.end()) {
        sets = &any->second;
      }
    }

    std::vector<ProductSet> res;
    if (!sets) {
      return res;
    }
    // max_results is deliberately ignored: callers must enforce the cap.
    for (const auto &set : *sets) {
      ProductSet products;
      for (const auto &id : set) {
        products.push_back(Structure{id, nullptr});
      }
      res.push_back(std::move(products));
    }
    return res;
  }

  bool matches_substructure(const Structure &structure,
                            const std::string &smarts) override {
    return structure.source_identifier.find(smarts) != std::string::npos;
  }

  std::map<RuleId, Sets> outputs;
  std::map<std::pair<RuleId, std::string>, Sets> outputs_for_inputs;
  std::map<RuleId, ProjectionErrorKind> failures;
  std::set<std::string> unparsable;
  std::set<std::string> uncanonicalizable;

  std::map<RuleId, int> compile_calls;
  std::map<RuleId, int> project_calls;
  std::map<RuleId, std::string> last_inputs;
  int total_project_calls = 0;
  int parse_calls = 0;
};

inline TransformationRule make_rule(RuleId id,
                                    CurationStatus status = CurationStatus::Unknown,
                                    int arity = 1,
                                    const std::string &tmpl = "[C:1]>>[C:1]O") {
  TransformationRule rule;
  rule.id = id;
  rule.rule_template = tmpl;
  rule.substrate_arity = arity;
  rule.curation_status = status;
  return rule;
}

}  // namespace testing
}  // namespace ro_validator

#endif  // RO_VALIDATOR_TEST_STUB_ENGINE_HPP

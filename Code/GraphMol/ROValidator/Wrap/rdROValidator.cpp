#include <RDBoost/python.h>
#include <RDBoost/Wrap.h>

#include <boost/python/stl_iterator.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include <GraphMol/ROValidator/knowledge_store.hpp>
#include <GraphMol/ROValidator/rdkit_chemistry_engine.hpp>
#include <GraphMol/ROValidator/reaction_validator.hpp>
#include <GraphMol/ROValidator/rule_corpus.hpp>
#include <GraphMol/ROValidator/score.hpp>
#include <GraphMol/ROValidator/seed_expander.hpp>

#include <map>
#include <memory>

namespace python = boost::python;
using namespace ro_validator;

namespace {
std::vector<std::string> listToStrings(python::object seq) {
  python::stl_input_iterator<std::string> begin(seq), end;
  return std::vector<std::string>(begin, end);
}

python::list stringsToList(const std::vector<std::string> &vals) {
  python::list res;
  for (const auto &v : vals) {
    res.append(v);
  }
  return res;
}

python::object curationStatusFromString(const std::string &label) {
  auto status = curation_status_from_string(label);
  return status ? python::object(*status) : python::object();
}

RuleCorpus *loadCorpus(const std::string &path) {
  return new RuleCorpus(RuleCorpus::load(path));
}

RuleCorpus *filterByArity(const RuleCorpus &self, int arity) {
  return new RuleCorpus(self.filter_by_substrate_arity(arity));
}

RuleCorpus *filterByStatus(const RuleCorpus &self, python::object statuses) {
  python::stl_input_iterator<CurationStatus> begin(statuses), end;
  return new RuleCorpus(
      self.filter_by_curation_status(std::set<CurationStatus>(begin, end)));
}

RuleCorpus *filterByIds(const RuleCorpus &self, python::object ids) {
  python::stl_input_iterator<RuleId> begin(ids), end;
  return new RuleCorpus(self.filter_by_ids(std::vector<RuleId>(begin, end)));
}

python::list corpusRules(const RuleCorpus &self) {
  python::list res;
  for (const auto &rule : self.rules()) {
    res.append(*rule);
  }
  return res;
}

/**
 * Validates reactions given directly as identifier lists. Chemicals get
 * stable ids in a private in-memory store, so repeated compositions hit the
 * cache.
 */
class PyReactionValidator : boost::noncopyable {
 public:
  PyReactionValidator(const RuleCorpus &corpus, bool use_inchi,
                      unsigned int max_projections)
      : d_engine(engineOptions(use_inchi)) {
    ValidatorOptions opts;
    opts.projector.max_projections = max_projections;
    d_validator = std::make_unique<ReactionValidator>(corpus, d_engine,
                                                      d_store, opts);
  }

  python::dict validate(python::object substrates, python::object products) {
    ObservedReaction rxn(++d_last_reaction_id);
    for (const auto &id : listToStrings(substrates)) {
      rxn.add_substrate(chemicalId(id),
                        rxn.substrate_coefficient(chemicalId(id)).value_or(0) +
                            1);
    }
    for (const auto &id : listToStrings(products)) {
      rxn.add_product(chemicalId(id));
    }

    python::dict res;
    const auto ranking = d_validator->validate(rxn);
    for (const auto &[rule_id, score] : ranking->to_rule_score_map()) {
      res[rule_id] = score;
    }
    return res;
  }

  python::list predict(python::object molecules) {
    std::vector<Structure> structures;
    for (const auto &id : listToStrings(molecules)) {
      structures.push_back(d_engine.normalize(d_engine.parse_structure(id)));
    }
    SingleSubstrateSeedExpander expander(d_validator->corpus(), structures,
                                         d_engine);
    RuleProjector projector(d_engine);
    PredictionGenerator generator(projector);

    python::list res;
    for (const auto &pred : generator.generate_all(expander.seeds())) {
      res.append(python::make_tuple(pred.rule_id,
                                    stringsToList(pred.substrate_identifiers),
                                    stringsToList(pred.product_identifiers)));
    }
    return res;
  }

  python::dict stats() const {
    const auto &s = d_validator->stats();
    python::dict res;
    res["reactions_validated"] = s.reactions_validated;
    res["cache_hits"] = s.cache_hits;
    res["reactions_matched"] = s.reactions_matched;
    res["reactions_failed"] = s.reactions_failed;
    return res;
  }

  void logSummary() const { d_validator->log_summary(); }

 private:
  static RDKitEngineOptions engineOptions(bool use_inchi) {
    RDKitEngineOptions opts;
    opts.identifier_format =
        use_inchi ? IdentifierFormat::Inchi : IdentifierFormat::Smiles;
    return opts;
  }

  ChemicalId chemicalId(const std::string &identifier) {
    auto it = d_ids.find(identifier);
    if (it != d_ids.end()) {
      return it->second;
    }
    const ChemicalId id = static_cast<ChemicalId>(d_ids.size()) + 1;
    d_store.add_chemical(id, identifier);
    d_ids.emplace(identifier, id);
    return id;
  }

  RDKitChemistryEngine d_engine;
  InMemoryKnowledgeStore d_store;
  std::unique_ptr<ReactionValidator> d_validator;
  std::map<std::string, ChemicalId> d_ids;
  std::int64_t d_last_reaction_id = 0;
};
}  // namespace

BOOST_PYTHON_MODULE(rdROValidator) {
  python::scope().attr("__doc__") =
      "Validation of observed reactions against reaction operator rules";

  python::enum_<CurationStatus>("CurationStatus")
      .value("Perfect", CurationStatus::Perfect)
      .value("ManuallyValidated", CurationStatus::ManuallyValidated)
      .value("ManuallyNotVerified", CurationStatus::ManuallyNotVerified)
      .value("ManuallyInvalidated", CurationStatus::ManuallyInvalidated)
      .value("Unknown", CurationStatus::Unknown);

  python::def("curation_score", &curation_score, (python::arg("status")),
              "Score awarded to a matching rule with this curation status");
  python::def("curation_status_from_string", &curationStatusFromString,
              (python::arg("label")),
              "Parse a curation status label, None if it is not recognised");
  python::scope().attr("UNMATCH_SCORE") = UNMATCH_SCORE;
  python::scope().attr("MAX_PROJECTIONS") = MAX_PROJECTIONS;

  python::class_<TransformationRule>("TransformationRule")
      .def_readwrite("id", &TransformationRule::id)
      .def_readwrite("rule_template", &TransformationRule::rule_template)
      .def_readwrite("substrate_arity", &TransformationRule::substrate_arity)
      .def_readwrite("product_arity", &TransformationRule::product_arity)
      .def_readwrite("curation_status", &TransformationRule::curation_status)
      .def_readwrite("name", &TransformationRule::name);

  python::class_<RuleCorpus, boost::shared_ptr<RuleCorpus>>("RuleCorpus",
                                                            python::no_init)
      .def("load", &loadCorpus, (python::arg("path")),
           python::return_value_policy<python::manage_new_object>(),
           "Load a rule corpus from a CSV or TSV file")
      .staticmethod("load")
      .def("__len__", &RuleCorpus::size)
      .def("rules", &corpusRules)
      .def("filter_by_substrate_arity", &filterByArity,
           (python::arg("self"), python::arg("arity")),
           python::return_value_policy<python::manage_new_object>())
      .def("filter_by_curation_status", &filterByStatus,
           (python::arg("self"), python::arg("statuses")),
           python::return_value_policy<python::manage_new_object>())
      .def("filter_by_ids", &filterByIds,
           (python::arg("self"), python::arg("ids")),
           python::return_value_policy<python::manage_new_object>());

  python::class_<PyReactionValidator, boost::shared_ptr<PyReactionValidator>,
                 boost::noncopyable>(
      "ReactionValidator",
      python::init<const RuleCorpus &, bool, unsigned int>(
          (python::arg("corpus"), python::arg("use_inchi") = false,
           python::arg("max_projections") = MAX_PROJECTIONS)))
      .def("validate", &PyReactionValidator::validate,
           (python::arg("self"), python::arg("substrates"),
            python::arg("products")),
           "Rule id -> score for every rule explaining the reaction.\n"
           "Repeating a substrate raises its coefficient.")
      .def("predict", &PyReactionValidator::predict,
           (python::arg("self"), python::arg("molecules")),
           "(rule_id, substrates, products) for every single-substrate rule\n"
           "applied to every molecule")
      .def("stats", &PyReactionValidator::stats)
      .def("log_summary", &PyReactionValidator::logSummary);
}

#ifndef RO_VALIDATOR_SEED_EXPANDER_HPP
#define RO_VALIDATOR_SEED_EXPANDER_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/chemistry_engine.hpp>
#include <GraphMol/ROValidator/rule_corpus.hpp>
#include <GraphMol/ROValidator/rule_projector.hpp>
#include <GraphMol/ROValidator/types.hpp>
#include <cstddef>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ro_validator {

/**
 * Substructure every substrate of a seed must contain for the seed to be
 * worth projecting.
 */
struct StructureActivityConstraint {
  std::string substructure_smarts;
};

struct PredictionSeed {
  std::string rule_id;
  std::vector<Structure> substrates;
  RulePtr rule;
  std::optional<StructureActivityConstraint> sar;
};

/**
 * Finite lazy sequence of the (rule, molecule) cross product, rule-major.
 * Rules the engine cannot compile are skipped. Every call to begin() starts
 * a new pass. Iterators refer to the sequence, which must outlive them.
 */
class RDKIT_ROVALIDATOR_EXPORT SeedSequence {
 public:
  class RDKIT_ROVALIDATOR_EXPORT iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = PredictionSeed;
    using difference_type = std::ptrdiff_t;
    using pointer = const PredictionSeed *;
    using reference = const PredictionSeed &;

    iterator() = default;

    reference operator*() const { return d_current; }
    pointer operator->() const { return &d_current; }
    iterator &operator++();
    iterator operator++(int) {
      iterator tmp = *this;
      ++*this;
      return tmp;
    }

    bool operator==(const iterator &o) const {
      return d_seq == o.d_seq && d_rule == o.d_rule && d_mol == o.d_mol;
    }
    bool operator!=(const iterator &o) const { return !(*this == o); }

   private:
    friend class SeedSequence;
    explicit iterator(const SeedSequence *seq);
    void settle();

    const SeedSequence *d_seq = nullptr;
    std::size_t d_rule = 0;
    std::size_t d_mol = 0;
    PredictionSeed d_current;
  };

  SeedSequence(RuleCorpus rules, std::vector<Structure> molecules,
               ChemistryEngine &engine);

  iterator begin() const { return iterator(this); }
  iterator end() const { return iterator(); }

  std::vector<PredictionSeed> materialize() const;

  // Upper bound: rules x molecules, before skipping uncompilable rules.
  std::size_t max_size() const {
    return d_rules.size() * d_molecules.size();
  }

 private:
  RuleCorpus d_rules;
  std::vector<Structure> d_molecules;
  ChemistryEngine *d_engine;
};

/**
 * Forward expansion over single-substrate rules: every arity-1 rule is
 * paired with every candidate molecule.
 */
class RDKIT_ROVALIDATOR_EXPORT SingleSubstrateSeedExpander {
 public:
  SingleSubstrateSeedExpander(const RuleCorpus &corpus,
                              std::vector<Structure> molecules,
                              ChemistryEngine &engine);

  SeedSequence seeds() const;

  // All seeds in one vector.
  std::vector<PredictionSeed> materialize() const;

 private:
  RuleCorpus d_corpus;
  std::vector<Structure> d_molecules;
  ChemistryEngine &d_engine;
};

/**
 * One hypothetical reaction: a seed together with one projected product
 * set.
 */
struct Prediction {
  int id = 0;
  std::string rule_id;
  std::vector<std::string> substrate_identifiers;
  std::vector<std::string> product_identifiers;
};

/**
 * Resolves prediction seeds into predictions with the same projection
 * primitive the validator uses.
 */
class RDKIT_ROVALIDATOR_EXPORT PredictionGenerator {
 public:
  explicit PredictionGenerator(RuleProjector &projector);

  /**
   * Predictions for one seed, numbered from `first_id`. Empty if the seed's
   * SAR rejects its substrates or the projection fails.
   */
  std::vector<Prediction> generate(const PredictionSeed &seed,
                                   int first_id = 0);

  template <typename SeedRange>
  std::vector<Prediction> generate_all(const SeedRange &seeds) {
    std::vector<Prediction> res;
    for (const auto &seed : seeds) {
      auto preds = generate(seed, static_cast<int>(res.size()));
      res.insert(res.end(), std::make_move_iterator(preds.begin()),
                 std::make_move_iterator(preds.end()));
    }
    return res;
  }

 private:
  bool passes_sar(const PredictionSeed &seed);
  std::string identifier_or_source(const Structure &structure);

  RuleProjector &d_projector;
};

RDKIT_ROVALIDATOR_EXPORT std::set<std::string> unique_product_identifiers(
    const std::vector<Prediction> &predictions);

}  // namespace ro_validator

#endif  // RO_VALIDATOR_SEED_EXPANDER_HPP

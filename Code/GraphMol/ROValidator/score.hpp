#ifndef RO_VALIDATOR_SCORE_HPP
#define RO_VALIDATOR_SCORE_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/types.hpp>
#include <array>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace ro_validator {

constexpr int UNMATCH_SCORE = -1;
constexpr int DEFAULT_MATCH_SCORE = 1;

/**
 * Score awarded to a matching rule, by curation status. Any status not in
 * the table scores DEFAULT_MATCH_SCORE. An unreviewed rule (Unknown) ranks
 * below a confirmed one and above one a curator rejected.
 */
constexpr std::array<std::pair<CurationStatus, int>, 4> CURATION_SCORE_TABLE{{
    {CurationStatus::Perfect, 4},
    {CurationStatus::ManuallyValidated, 3},
    {CurationStatus::Unknown, 2},
    {CurationStatus::ManuallyInvalidated, 0},
}};

RDKIT_ROVALIDATOR_EXPORT int curation_score(CurationStatus status);

/**
 * Outcome of testing one rule against one reaction
 */
struct ScoreVerdict {
  bool matched = false;
  int score = UNMATCH_SCORE;

  static ScoreVerdict unmatch() { return ScoreVerdict{}; }
  static ScoreVerdict match(int score) { return ScoreVerdict{true, score}; }

  bool operator==(const ScoreVerdict &o) const {
    return matched == o.matched && score == o.score;
  }
};

/**
 * Rules that explain one reaction, bucketed by score, best first. Rule ids
 * keep the order in which they were added.
 */
class RDKIT_ROVALIDATOR_EXPORT ScoreRanking {
 public:
  using Buckets = std::map<int, std::vector<RuleId>, std::greater<int>>;

  void add(int score, RuleId rule_id);

  bool empty() const { return d_buckets.empty(); }
  std::size_t num_rules() const;

  // Throws std::out_of_range when empty.
  int best_score() const;

  // Empty vector if no rule achieved this score.
  const std::vector<RuleId> &rules_with_score(int score) const;

  const Buckets &buckets() const { return d_buckets; }

  /**
   * Flatten to the rule id -> score mapping stored on the validated
   * reaction's record.
   */
  std::map<RuleId, int> to_rule_score_map() const;

  bool operator==(const ScoreRanking &o) const {
    return d_buckets == o.d_buckets;
  }
  bool operator!=(const ScoreRanking &o) const { return !(*this == o); }

 private:
  Buckets d_buckets;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_SCORE_HPP

#include "score.hpp"

#include <algorithm>
#include <stdexcept>

namespace ro_validator {

int curation_score(CurationStatus status) {
  auto it = std::find_if(
      CURATION_SCORE_TABLE.begin(), CURATION_SCORE_TABLE.end(),
      [status](const auto &entry) { return entry.first == status; });
  if (it == CURATION_SCORE_TABLE.end()) {
    return DEFAULT_MATCH_SCORE;
  }
  return it->second;
}

void ScoreRanking::add(int score, RuleId rule_id) {
  d_buckets[score].push_back(rule_id);
}

std::size_t ScoreRanking::num_rules() const {
  std::size_t n = 0;
  for (const auto &[score, ids] : d_buckets) {
    n += ids.size();
  }
  return n;
}

int ScoreRanking::best_score() const {
  if (d_buckets.empty()) {
    throw std::out_of_range("ScoreRanking is empty");
  }
  return d_buckets.begin()->first;
}

const std::vector<RuleId> &ScoreRanking::rules_with_score(int score) const {
  static const std::vector<RuleId> none;
  auto it = d_buckets.find(score);
  return it == d_buckets.end() ? none : it->second;
}

std::map<RuleId, int> ScoreRanking::to_rule_score_map() const {
  std::map<RuleId, int> res;
  for (const auto &[score, ids] : d_buckets) {
    for (const auto id : ids) {
      // a rule listed under several scores keeps the best one
      res.emplace(id, score);
    }
  }
  return res;
}

}  // namespace ro_validator

#ifndef RO_VALIDATOR_COMPOSITION_CACHE_HPP
#define RO_VALIDATOR_COMPOSITION_CACHE_HPP

#include <GraphMol/ROValidator/ro_validator_export.h>
#include <GraphMol/ROValidator/composition_key.hpp>
#include <GraphMol/ROValidator/score.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace ro_validator {

using ScoreRankingPtr = std::shared_ptr<const ScoreRanking>;

/**
 * Rankings of one validation run, keyed by reaction composition. Valid only
 * for the rule corpus it was filled with.
 */
class RDKIT_ROVALIDATOR_EXPORT CompositionCache {
 public:
  struct Entry {
    std::int64_t first_reaction_id;  // reaction whose validation filled it
    ScoreRankingPtr ranking;
  };

  std::optional<Entry> find(const CompositionKey &key) const;

  /**
   * Store `ranking` unless the key is already present. Returns the entry
   * held by the cache afterwards, which is the earlier one on a race.
   */
  Entry insert_if_absent(const CompositionKey &key, std::int64_t reaction_id,
                         ScoreRankingPtr ranking);

  std::size_t size() const;
  void clear();

 private:
  mutable std::mutex d_mutex;
  std::unordered_map<CompositionKey, Entry, CompositionKeyHash> d_entries;
};

}  // namespace ro_validator

#endif  // RO_VALIDATOR_COMPOSITION_CACHE_HPP

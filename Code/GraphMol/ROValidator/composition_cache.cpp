#include "composition_cache.hpp"

#include <utility>

namespace ro_validator {

std::optional<CompositionCache::Entry> CompositionCache::find(
    const CompositionKey &key) const {
  std::lock_guard<std::mutex> lock(d_mutex);
  auto it = d_entries.find(key);
  if (it == d_entries.end()) {
    return std::nullopt;
  }
  return it->second;
}

CompositionCache::Entry CompositionCache::insert_if_absent(
    const CompositionKey &key, std::int64_t reaction_id,
    ScoreRankingPtr ranking) {
  std::lock_guard<std::mutex> lock(d_mutex);
  auto res = d_entries.try_emplace(key, Entry{reaction_id, std::move(ranking)});
  return res.first->second;
}

std::size_t CompositionCache::size() const {
  std::lock_guard<std::mutex> lock(d_mutex);
  return d_entries.size();
}

void CompositionCache::clear() {
  std::lock_guard<std::mutex> lock(d_mutex);
  d_entries.clear();
}

}  // namespace ro_validator

#include "internal/index/memory_index.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace trustmem::index {

void MemoryIndex::Unlink(Postings& postings, const std::string& key, const std::string& reference) {
  auto it = postings.find(key);
  if (it == postings.end()) return;
  it->second.erase(reference);
  if (it->second.empty()) postings.erase(it);
}

void MemoryIndex::EraseLocked(const std::string& reference) {
  auto it = entries_.find(reference);
  if (it == entries_.end()) return;

  const auto& e = it->second;
  Unlink(by_component_, e.component, reference);
  Unlink(by_loop_, e.loop_id, reference);
  Unlink(by_domain_, e.domain, reference);
  for (const auto& tag : e.tags)
    Unlink(by_tag_, tag, reference);

  if (auto cat = by_category_.find(static_cast<int>(e.category)); cat != by_category_.end()) {
    cat->second.erase(reference);
    if (cat->second.empty()) by_category_.erase(cat);
  }

  all_.erase(reference);
  entries_.erase(it);
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

void MemoryIndex::Insert(const IndexEntry& entry) {
  std::unique_lock lock(mutex_);

  EraseLocked(entry.reference);

  by_component_[entry.component].insert(entry.reference);
  by_category_[static_cast<int>(entry.category)].insert(entry.reference);
  by_loop_[entry.loop_id].insert(entry.reference);
  if (!entry.domain.empty()) by_domain_[entry.domain].insert(entry.reference);
  for (const auto& tag : entry.tags)
    by_tag_[tag].insert(entry.reference);

  all_.insert(entry.reference);
  entries_[entry.reference] = entry;
}

void MemoryIndex::Remove(const std::string& reference) {
  std::unique_lock lock(mutex_);
  EraseLocked(reference);
}

void MemoryIndex::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  all_.clear();
  by_component_.clear();
  by_category_.clear();
  by_loop_.clear();
  by_domain_.clear();
  by_tag_.clear();
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::vector<std::string> MemoryIndex::Lookup(const IndexQuery& query) const {
  std::shared_lock lock(mutex_);

  if (query.Empty()) {
    return {all_.begin(), all_.end()};
  }

  static const std::set<std::string> kEmpty;
  std::vector<const std::set<std::string>*> sets;

  auto add = [&](const Postings& postings, const std::optional<std::string>& key) {
    if (!key) return;
    auto it = postings.find(*key);
    sets.push_back(it == postings.end() ? &kEmpty : &it->second);
  };

  add(by_component_, query.component);
  add(by_loop_, query.loop_id);
  add(by_domain_, query.domain);
  add(by_tag_, query.tag);
  if (query.category) {
    auto it = by_category_.find(static_cast<int>(*query.category));
    sets.push_back(it == by_category_.end() ? &kEmpty : &it->second);
  }

  std::sort(sets.begin(), sets.end(), [](const auto* a, const auto* b) { return a->size() < b->size(); });

  std::vector<std::string> result(sets.front()->begin(), sets.front()->end());
  for (size_t i = 1; i < sets.size() && !result.empty(); ++i) {
    std::vector<std::string> narrowed;
    std::set_intersection(result.begin(), result.end(), sets[i]->begin(), sets[i]->end(), std::back_inserter(narrowed));
    result = std::move(narrowed);
  }
  return result;
}

bool MemoryIndex::Contains(const std::string& reference) const {
  std::shared_lock lock(mutex_);
  return entries_.contains(reference);
}

std::size_t MemoryIndex::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace trustmem::index

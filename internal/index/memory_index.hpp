#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "trustmem/v1/memory.pb.h"

namespace trustmem::index {

struct IndexEntry {
  std::string                  reference;
  std::string                  component;
  trustmem::v1::OutputCategory category = trustmem::v1::OUTPUT_CATEGORY_UNSPECIFIED;
  std::string                  loop_id;
  std::string                  domain;
  std::vector<std::string>     tags;
};

// Unset fields do not constrain the lookup.
struct IndexQuery {
  std::optional<std::string>                  component;
  std::optional<trustmem::v1::OutputCategory> category;
  std::optional<std::string>                  loop_id;
  std::optional<std::string>                  domain;
  std::optional<std::string>                  tag;

  bool Empty() const {
    return !component && !category && !loop_id && !domain && !tag;
  }
};

/*
  Secondary index over artifact references.

  Posting sets per component, category, loop id, domain and tag, plus the set
  of every indexed reference. Lookups intersect the postings of the present
  filters and copy the result out, so no caller scores under the index lock.
  Archived artifacts stay indexed; deleted artifacts are removed.
*/
class MemoryIndex {
 public:
  // Re-inserting a reference replaces its previous keys.
  void Insert(const IndexEntry& entry);

  void Remove(const std::string& reference);

  // Sorted, de-duplicated references.
  std::vector<std::string> Lookup(const IndexQuery& query) const;

  bool Contains(const std::string& reference) const;

  std::size_t Size() const;

  void Clear();

 private:
  using Postings = std::unordered_map<std::string, std::set<std::string>>;

  void EraseLocked(const std::string& reference);

  static void Unlink(Postings& postings, const std::string& key, const std::string& reference);

  mutable std::shared_mutex mutex_;

  std::unordered_map<std::string, IndexEntry> entries_;
  std::set<std::string>                       all_;

  Postings                                      by_component_;
  std::unordered_map<int, std::set<std::string>> by_category_;
  Postings                                      by_loop_;
  Postings                                      by_domain_;
  Postings                                      by_tag_;
};

} // namespace trustmem::index

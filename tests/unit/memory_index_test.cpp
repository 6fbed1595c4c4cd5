#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/index/memory_index.hpp"

namespace {

using trustmem::index::IndexEntry;
using trustmem::index::IndexQuery;
using trustmem::index::MemoryIndex;
using namespace trustmem::v1;

IndexEntry Entry(const std::string& ref, const std::string& component, OutputCategory category, const std::string& domain,
                 std::vector<std::string> tags) {
  return IndexEntry{
      .reference = ref,
      .component = component,
      .category  = category,
      .loop_id   = ref < "mem_c" ? "loop-a" : "loop-b",
      .domain    = domain,
      .tags      = std::move(tags),
  };
}

// MemoryIndex is not movable (it owns a mutex), so the populated fixture is a
// type constructed in place rather than a function returning by value.
struct Populated : MemoryIndex {
  Populated() {
    Insert(Entry("mem_a", "hunter", OUTPUT_CATEGORY_OBSERVATION, "security", {"cve", "scan"}));
    Insert(Entry("mem_b", "hunter", OUTPUT_CATEGORY_PREDICTION, "security", {"scan"}));
    Insert(Entry("mem_c", "parliament", OUTPUT_CATEGORY_DECISION, "governance", {"vote"}));
    Insert(Entry("mem_d", "reflection", OUTPUT_CATEGORY_REASONING, "security", {"cve"}));
  }
};

void TestEmptyQueryReturnsEverything() {
  auto index = Populated();
  assert(index.Size() == 4);
  assert((index.Lookup(IndexQuery{}) == std::vector<std::string>{"mem_a", "mem_b", "mem_c", "mem_d"}));
}

void TestSingleFilters() {
  auto index = Populated();

  IndexQuery by_component;
  by_component.component = "hunter";
  assert((index.Lookup(by_component) == std::vector<std::string>{"mem_a", "mem_b"}));

  IndexQuery by_category;
  by_category.category = OUTPUT_CATEGORY_DECISION;
  assert((index.Lookup(by_category) == std::vector<std::string>{"mem_c"}));

  IndexQuery by_tag;
  by_tag.tag = "cve";
  assert((index.Lookup(by_tag) == std::vector<std::string>{"mem_a", "mem_d"}));

  IndexQuery by_loop;
  by_loop.loop_id = "loop-b";
  assert((index.Lookup(by_loop) == std::vector<std::string>{"mem_c", "mem_d"}));

  IndexQuery unknown;
  unknown.component = "nobody";
  assert(index.Lookup(unknown).empty());
}

void TestFiltersIntersect() {
  auto index = Populated();

  IndexQuery query;
  query.domain = "security";
  query.tag    = "scan";
  assert((index.Lookup(query) == std::vector<std::string>{"mem_a", "mem_b"}));

  query.category = OUTPUT_CATEGORY_PREDICTION;
  assert((index.Lookup(query) == std::vector<std::string>{"mem_b"}));

  query.component = "parliament";
  assert(index.Lookup(query).empty());
}

void TestRemoveAndReinsert() {
  auto index = Populated();

  index.Remove("mem_a");
  assert(!index.Contains("mem_a"));
  assert(index.Size() == 3);

  IndexQuery by_tag;
  by_tag.tag = "cve";
  assert((index.Lookup(by_tag) == std::vector<std::string>{"mem_d"}));

  // Re-inserting replaces the previous keys.
  index.Insert(Entry("mem_d", "reflection", OUTPUT_CATEGORY_REASONING, "security", {"retro"}));
  assert(index.Lookup(by_tag).empty());
  by_tag.tag = "retro";
  assert((index.Lookup(by_tag) == std::vector<std::string>{"mem_d"}));
  assert(index.Size() == 3);

  index.Remove("mem_missing");
  assert(index.Size() == 3);

  index.Clear();
  assert(index.Size() == 0);
  assert(index.Lookup(IndexQuery{}).empty());
}

} // namespace

int main() {
  TestEmptyQueryReturnsEverything();
  TestSingleFilters();
  TestFiltersIntersect();
  TestRemoveAndReinsert();

  std::cout << "memory_index_test: pass\n";
  return 0;
}

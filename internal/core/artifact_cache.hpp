#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/artifact_record.hpp"

namespace trustmem::core {

/*
  Artifact snapshot cache.

  Consistency model:
  - Read paths serve records from this cache and never hit the repository.
  - Mutations routed through MemoryBank refresh or invalidate entries right
    after their transaction commits.
  - Out-of-band repository writes stay invisible until HydrateCaches().

  Records are spread over kShards shards, each behind its own shared mutex,
  so writers on different references rarely contend. Get and Snapshot hand
  out copies so nobody scores under a cache lock.
*/
class ArtifactCache {
 public:
  void Put(const db::model::ArtifactRecord& record);

  void Erase(const std::string& reference);

  std::optional<db::model::ArtifactRecord> Get(const std::string& reference) const;

  std::vector<db::model::ArtifactRecord> Snapshot() const;

  std::size_t Size() const;

  void Clear();

 private:
  static constexpr std::size_t kShards = 16;

  struct Shard {
    mutable std::shared_mutex                                  mutex;
    std::unordered_map<std::string, db::model::ArtifactRecord> records;
  };

  Shard&       ShardFor(const std::string& reference);
  const Shard& ShardFor(const std::string& reference) const;

  std::array<Shard, kShards> shards_;
};

} // namespace trustmem::core

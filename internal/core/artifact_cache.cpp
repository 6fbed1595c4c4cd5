#include "internal/core/artifact_cache.hpp"

#include <functional>
#include <mutex>

namespace trustmem::core {

ArtifactCache::Shard& ArtifactCache::ShardFor(const std::string& reference) {
  return shards_[std::hash<std::string>{}(reference) % kShards];
}

const ArtifactCache::Shard& ArtifactCache::ShardFor(const std::string& reference) const {
  return shards_[std::hash<std::string>{}(reference) % kShards];
}

void ArtifactCache::Put(const db::model::ArtifactRecord& record) {
  auto&            shard = ShardFor(record.reference);
  std::unique_lock lock(shard.mutex);
  shard.records[record.reference] = record;
}

void ArtifactCache::Erase(const std::string& reference) {
  auto&            shard = ShardFor(reference);
  std::unique_lock lock(shard.mutex);
  shard.records.erase(reference);
}

std::optional<db::model::ArtifactRecord> ArtifactCache::Get(const std::string& reference) const {
  const auto&      shard = ShardFor(reference);
  std::shared_lock lock(shard.mutex);

  auto it = shard.records.find(reference);
  if (it == shard.records.end()) return std::nullopt;

  return it->second;
}

std::vector<db::model::ArtifactRecord> ArtifactCache::Snapshot() const {
  std::vector<db::model::ArtifactRecord> out;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    for (const auto& [_, record] : shard.records) out.push_back(record);
  }
  return out;
}

std::size_t ArtifactCache::Size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    std::shared_lock lock(shard.mutex);
    total += shard.records.size();
  }
  return total;
}

void ArtifactCache::Clear() {
  for (auto& shard : shards_) {
    std::unique_lock lock(shard.mutex);
    shard.records.clear();
  }
}

} // namespace trustmem::core

#include "memory_repository.hpp"

#include <algorithm>
#include <map>
#include <mutex>

#include "memory_tx.hpp"

namespace trustmem::db::memory {

namespace {

bool Matches(const model::ArtifactRecord& r, const ArtifactScan& scan) {
  if (r.deleted && !scan.include_deleted) return false;
  if (scan.component && r.component != *scan.component) return false;
  if (scan.category && r.category != *scan.category) return false;
  if (scan.loop_id && r.loop_id != *scan.loop_id) return false;
  if (scan.domain && r.domain != *scan.domain) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::ArtifactRecord> MemoryRepository::Committed(const std::string& reference) const {
  std::shared_lock lock(mutex_);
  auto             it = committed_.artifacts.find(reference);
  if (it == committed_.artifacts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto& writes = TX(t).Artifacts();
  auto  it     = writes.find(r.reference);
  if (it != writes.end() && it->second.record) return Result::Err(ErrorCode::AlreadyExists, r.reference);
  if (it == writes.end() && Committed(r.reference)) return Result::Err(ErrorCode::AlreadyExists, r.reference);

  writes[r.reference] = MemoryTransaction::ArtifactWrite{.record = r, .expect_absent = it == writes.end()};
  return Result::Ok();
}

std::optional<model::ArtifactRecord> MemoryRepository::GetArtifact(Transaction& t, const std::string& reference) {
  auto& writes = TX(t).Artifacts();
  auto  it     = writes.find(reference);
  if (it != writes.end()) return it->second.record;
  return Committed(reference);
}

std::vector<model::ArtifactRecord> MemoryRepository::ScanArtifacts(Transaction& t, const ArtifactScan& scan) {
  std::map<std::string, model::ArtifactRecord> merged;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [reference, record] : committed_.artifacts) {
      if (Matches(record, scan)) merged.emplace(reference, record);
    }
  }

  for (const auto& [reference, write] : TX(t).Artifacts()) {
    merged.erase(reference);
    if (write.record && Matches(*write.record, scan)) merged.emplace(reference, *write.record);
  }

  std::vector<model::ArtifactRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

Result MemoryRepository::UpdateArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto current = GetArtifact(t, r.reference);
  if (!current) return Result::Err(ErrorCode::NotFound, r.reference);
  if (current->version + 1 != r.version) {
    return Result::Err(ErrorCode::Conflict, "stale version for " + r.reference);
  }

  auto& writes = TX(t).Artifacts();
  auto  it     = writes.find(r.reference);
  if (it != writes.end()) {
    it->second.record = r;
  } else {
    writes[r.reference] = MemoryTransaction::ArtifactWrite{.record = r, .expect_version = current->version};
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteArtifact(Transaction& t, const std::string& reference) {
  auto current = GetArtifact(t, reference);
  if (!current) return Result::Err(ErrorCode::NotFound, reference);

  auto& writes = TX(t).Artifacts();
  auto  it     = writes.find(reference);
  if (it != writes.end()) {
    it->second.record.reset();
  } else {
    writes[reference] = MemoryTransaction::ArtifactWrite{.record = std::nullopt, .expect_version = current->version};
  }
  return Result::Ok();
}

Result MemoryRepository::AppendTrustEvent(Transaction& t, const model::TrustEventRecord& r) {
  if (r.reference.empty()) return Result::Err(ErrorCode::ConstraintViolation, "trust event without reference");
  TX(t).Events().push_back(r);
  return Result::Ok();
}

std::vector<model::TrustEventRecord> MemoryRepository::ListTrustEvents(Transaction& t, const std::string& reference) {
  std::vector<model::TrustEventRecord> out;
  {
    std::shared_lock lock(mutex_);
    auto             it = committed_.events.find(reference);
    if (it != committed_.events.end()) out = it->second;
  }
  for (const auto& e : TX(t).Events())
    if (e.reference == reference) out.push_back(e);
  return out;
}

Result MemoryRepository::AppendGcLog(Transaction& t, const model::GcLogRecord& r) {
  TX(t).GcLog().push_back(r);
  return Result::Ok();
}

std::vector<model::GcLogRecord> MemoryRepository::ListGcLog(Transaction& t, std::size_t limit) {
  std::vector<model::GcLogRecord> out;
  const auto&                     pending = TX(t).GcLog();
  for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
    if (limit != 0 && out.size() >= limit) return out;
    out.push_back(*it);
  }

  std::shared_lock lock(mutex_);
  for (auto it = committed_.gc_log.rbegin(); it != committed_.gc_log.rend(); ++it) {
    if (limit != 0 && out.size() >= limit) break;
    out.push_back(*it);
  }
  return out;
}

} // namespace trustmem::db::memory

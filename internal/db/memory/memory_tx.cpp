#include "memory_tx.hpp"

#include <mutex>
#include <stdexcept>

namespace trustmem::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  std::unique_lock lock(repo_.mutex_);
  auto&            state = repo_.committed_;

  for (const auto& [reference, write] : artifacts_) {
    const auto it = state.artifacts.find(reference);
    if (write.expect_absent && it != state.artifacts.end()) {
      throw std::runtime_error("transaction conflict: artifact already exists: " + reference);
    }
    if (write.expect_version) {
      if (it == state.artifacts.end() || it->second.version != *write.expect_version) {
        throw std::runtime_error("transaction conflict: artifact modified concurrently: " + reference);
      }
    }
  }

  for (auto& [reference, write] : artifacts_) {
    if (write.record) {
      state.artifacts[reference] = std::move(*write.record);
    } else {
      state.artifacts.erase(reference);
    }
  }

  for (auto& event : events_) {
    event.sequence = state.next_event_sequence++;
    state.events[event.reference].push_back(std::move(event));
  }

  for (auto& entry : gc_log_) {
    entry.sequence = state.next_gc_sequence++;
    state.gc_log.push_back(std::move(entry));
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  artifacts_.clear();
  events_.clear();
  gc_log_.clear();
  rolled_back_ = true;
}

} // namespace trustmem::db::memory

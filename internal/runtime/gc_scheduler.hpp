#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

#include "internal/util/time.hpp"
#include "trustmem/v1/memory.pb.h"

namespace trustmem::core {
class MemoryBank;
}

namespace trustmem::runtime {

struct GcSchedule {
  // Policy swept every gc_interval; no sweep when unset or interval is zero.
  std::optional<trustmem::v1::GcPolicy> policy;
  util::Duration                        gc_interval{0};
  // Zero disables decay snapshots.
  util::Duration decay_snapshot_interval{0};
};

/*
  Periodically runs garbage collection and decay snapshots on a bank.

  A sweep in progress is cancelled through its stop token when Stop() is
  called; completed decisions stay committed.
*/
class GcScheduler {
 public:
  GcScheduler(std::shared_ptr<core::MemoryBank> bank, GcSchedule schedule);
  ~GcScheduler();

  GcScheduler(const GcScheduler&)            = delete;
  GcScheduler& operator=(const GcScheduler&) = delete;

  void Start();
  void Stop();

  uint64_t Runs() const {
    return runs_.load();
  }

 private:
  void Loop(std::stop_token stop);

  std::shared_ptr<core::MemoryBank> bank_;
  GcSchedule                        schedule_;

  std::mutex                  mutex_;
  std::condition_variable_any wake_;
  std::jthread                thread_;
  std::atomic<uint64_t>       runs_{0};
};

} // namespace trustmem::runtime

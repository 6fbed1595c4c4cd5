#include "internal/runtime/gc_scheduler.hpp"

#include <algorithm>
#include <chrono>

#include "internal/core/memory_bank.hpp"
#include "internal/observability/logging.hpp"

namespace trustmem::runtime {

GcScheduler::GcScheduler(std::shared_ptr<core::MemoryBank> bank, GcSchedule schedule) : bank_(std::move(bank)), schedule_(std::move(schedule)) {
}

GcScheduler::~GcScheduler() {
  Stop();
}

void GcScheduler::Start() {
  if (thread_.joinable()) return;

  const bool gc_enabled       = schedule_.policy && schedule_.gc_interval.count() > 0;
  const bool snapshot_enabled = schedule_.decay_snapshot_interval.count() > 0;
  if (!gc_enabled && !snapshot_enabled) {
    TRUSTMEM_LOG_INFO("gc scheduler disabled");
    return;
  }

  thread_ = std::jthread([this](std::stop_token stop) { Loop(stop); });
  TRUSTMEM_LOG_INFO("gc scheduler started",
                    {observability::StringField("policy", schedule_.policy ? schedule_.policy->name() : ""),
                     observability::IntField("gc_interval_ms", schedule_.gc_interval.count()),
                     observability::IntField("snapshot_interval_ms", schedule_.decay_snapshot_interval.count())});
}

void GcScheduler::Stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  wake_.notify_all();
  thread_.join();
  TRUSTMEM_LOG_INFO("gc scheduler stopped");
}

void GcScheduler::Loop(std::stop_token stop) {
  using Clock = std::chrono::steady_clock;

  const bool gc_enabled       = schedule_.policy && schedule_.gc_interval.count() > 0;
  const bool snapshot_enabled = schedule_.decay_snapshot_interval.count() > 0;

  auto next_gc       = Clock::now() + schedule_.gc_interval;
  auto next_snapshot = Clock::now() + schedule_.decay_snapshot_interval;

  while (!stop.stop_requested()) {
    auto deadline = Clock::time_point::max();
    if (gc_enabled) deadline = std::min(deadline, next_gc);
    if (snapshot_enabled) deadline = std::min(deadline, next_snapshot);

    {
      std::unique_lock lock(mutex_);
      wake_.wait_until(lock, stop, deadline, [] { return false; });
    }
    if (stop.stop_requested()) break;

    const auto now = Clock::now();

    if (gc_enabled && now >= next_gc) {
      next_gc = now + schedule_.gc_interval;
      try {
        bank_->GarbageCollect(*schedule_.policy, stop);
        runs_.fetch_add(1);
      } catch (const std::exception& e) {
        TRUSTMEM_LOG_ERROR("scheduled gc failed",
                           {observability::StringField("policy", schedule_.policy->name()), observability::StringField("error", e.what())});
      }
    }

    if (snapshot_enabled && now >= next_snapshot) {
      next_snapshot = now + schedule_.decay_snapshot_interval;
      try {
        bank_->SnapshotDecay();
      } catch (const std::exception& e) {
        TRUSTMEM_LOG_ERROR("decay snapshot failed", {observability::StringField("error", e.what())});
      }
    }
  }
}

} // namespace trustmem::runtime

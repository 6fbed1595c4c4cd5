#include "internal/ledger/trust_ledger.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace trustmem::ledger {

TrustLedger::TrustLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void TrustLedger::RecordGap(const std::string& what, const std::string& reference, const std::string& error) {
  audit_gaps_.fetch_add(1);
  observability::Metrics::Instance().RecordAuditGap();
  TRUSTMEM_LOG_WARN("audit gap",
                    {observability::StringField("record", what), observability::StringField("reference", reference),
                     observability::StringField("error", error)});
}

bool TrustLedger::Append(const db::model::TrustEventRecord& event) {
  return Append(std::vector<db::model::TrustEventRecord>{event});
}

bool TrustLedger::Append(const std::vector<db::model::TrustEventRecord>& events) {
  if (events.empty()) return true;

  try {
    auto tx = repository_->Begin();
    for (const auto& event : events) {
      const auto result = repository_->AppendTrustEvent(*tx, event);
      if (!result) {
        tx->Rollback();
        RecordGap("trust_event", event.reference, std::string(db::ToString(result.code)) + ": " + result.message);
        return false;
      }
    }
    tx->Commit();
  } catch (const std::exception& e) {
    RecordGap("trust_event", events.front().reference, e.what());
    return false;
  }
  return true;
}

bool TrustLedger::AppendGcLog(const db::model::GcLogRecord& entry) {
  try {
    auto       tx     = repository_->Begin();
    const auto result = repository_->AppendGcLog(*tx, entry);
    if (!result) {
      tx->Rollback();
      RecordGap("gc_log", entry.policy_name, std::string(db::ToString(result.code)) + ": " + result.message);
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    RecordGap("gc_log", entry.policy_name, e.what());
    return false;
  }
  return true;
}

std::vector<db::model::TrustEventRecord> TrustLedger::History(const std::string& reference) const {
  try {
    auto tx     = repository_->Begin();
    auto events = repository_->ListTrustEvents(*tx, reference);
    tx->Commit();
    return events;
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("read trust history: ") + e.what());
  }
}

std::vector<db::model::GcLogRecord> TrustLedger::RecentGcLog(std::size_t limit) const {
  try {
    auto tx      = repository_->Begin();
    auto entries = repository_->ListGcLog(*tx, limit);
    tx->Commit();
    return entries;
  } catch (const std::exception& e) {
    throw util::StorageError(std::string("read gc log: ") + e.what());
  }
}

} // namespace trustmem::ledger

#pragma once

#include <cstdint>
#include <string>

#include "trustmem/v1/memory.pb.h"

namespace trustmem::db::model {

struct TrustEventRecord {
  // Assigned by the repository at commit.
  uint64_t    sequence = 0;
  std::string reference;

  trustmem::v1::TrustEventKind kind = trustmem::v1::TRUST_EVENT_KIND_UNSPECIFIED;

  std::string reason;
  std::string actor;

  double trust_before = 0.0;
  double trust_after  = 0.0;

  double provenance_delta = 0.0;
  double consensus_delta  = 0.0;
  double governance_delta = 0.0;
  double usage_delta      = 0.0;

  int64_t timestamp_ms = 0;
};

}

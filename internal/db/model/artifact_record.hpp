#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "trustmem/v1/memory.pb.h"

namespace trustmem::db::model {

/*
  Persistent artifact row.

  IMPORTANT:
  - All trust signals and the composite are stored clamped to [0,1].
  - trust is the value as of scored_at_ms; readers decay it forward.
  - Version is bumped on every update and used as a compare-and-set fence.
*/

struct ArtifactRecord {
  std::string reference;
  std::string loop_id;
  std::string component;

  trustmem::v1::OutputCategory category = trustmem::v1::OUTPUT_CATEGORY_UNSPECIFIED;

  // google.protobuf.Struct as JSON text
  std::string              payload_json = "{}";
  std::vector<std::string> tags;
  std::string              domain;

  double trust      = 0.0;
  double provenance = 0.0;
  double consensus  = 0.0;
  double governance = 0.0;
  double usage      = 0.0;

  double      producer_confidence = 0.0;
  double      importance          = 0.5;
  std::string reasoning_chain_id;

  trustmem::v1::DecayCurve decay_curve  = trustmem::v1::DECAY_CURVE_UNSPECIFIED;
  int64_t                  half_life_ms = 0;

  uint64_t access_count        = 0;
  uint64_t success_count       = 0;
  uint64_t failure_count       = 0;
  int64_t  last_accessed_at_ms = 0;

  bool                     constitutional_compliance = true;
  std::vector<std::string> violations;
  bool                     requires_manual_review = false;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
  int64_t scored_at_ms  = 0;
  // 0 = none
  int64_t expires_at_ms = 0;

  bool archived = false;
  bool deleted  = false;

  uint64_t version = 0;
};

}

#pragma once

#include <cstdint>
#include <string>

namespace trustmem::db::model {

/*
  One row per garbage collection run, including dry runs and cancelled runs.
*/

struct GcLogRecord {
  uint64_t    sequence = 0;
  std::string policy_name;

  uint64_t scanned  = 0;
  uint64_t archived = 0;
  uint64_t deleted  = 0;

  double  archive_threshold = 0.0;
  double  delete_threshold  = 0.0;
  int64_t max_age_ms        = 0;

  int64_t duration_ms  = 0;
  int64_t timestamp_ms = 0;

  bool dry_run   = false;
  bool cancelled = false;
};

}

#pragma once

#include "sqlite_db.hpp"

namespace trustmem::db::sqlite {

inline constexpr int kSchemaVersion = 1;

/*
  Creates the artifact, artifact_tag, trust_event and gc_log tables if they
  are missing, probes each for the expected columns and stamps
  kSchemaVersion. A file stamped by a newer build is refused.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace trustmem::db::sqlite

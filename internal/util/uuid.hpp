#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace trustmem::util {

/*
  Identifier helpers

  Artifact references are "mem_" followed by 16 lowercase hex characters
  (64 random bits).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string GenerateReference();
bool        IsReference(const std::string& value);

} // namespace trustmem::util

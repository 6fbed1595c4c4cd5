#pragma once

#include <map>

#include "trustmem/v1/memory.pb.h"

namespace trustmem::governance {

/*
  Category -> requires-compliance table.

  Categories without an explicit entry require compliance.
*/
class CategoryPolicyTable {
 public:
  CategoryPolicyTable() = default;

  void SetRequiresCompliance(trustmem::v1::OutputCategory category, bool required);

  bool RequiresCompliance(trustmem::v1::OutputCategory category) const;

 private:
  std::map<trustmem::v1::OutputCategory, bool> requires_compliance_;
};

} // namespace trustmem::governance

#include "internal/governance/category_policy.hpp"

namespace trustmem::governance {

void CategoryPolicyTable::SetRequiresCompliance(trustmem::v1::OutputCategory category, bool required) {
  requires_compliance_[category] = required;
}

bool CategoryPolicyTable::RequiresCompliance(trustmem::v1::OutputCategory category) const {
  auto it = requires_compliance_.find(category);
  return it == requires_compliance_.end() ? true : it->second;
}

} // namespace trustmem::governance

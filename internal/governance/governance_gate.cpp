#include "internal/governance/governance_gate.hpp"

namespace trustmem::governance {

GovernanceVerdict DeclaredComplianceGate::Evaluate(const trustmem::v1::ProducerOutput& output) const {
  GovernanceVerdict verdict;
  verdict.compliant = output.constitutional_compliance();
  verdict.violations.assign(output.violations().begin(), output.violations().end());
  return verdict;
}

} // namespace trustmem::governance

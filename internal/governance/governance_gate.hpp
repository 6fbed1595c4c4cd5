#pragma once

#include <string>
#include <vector>

#include "trustmem/v1/memory.pb.h"

namespace trustmem::governance {

struct GovernanceVerdict {
  bool                     compliant = true;
  std::vector<std::string> violations;
};

/*
  Pass/fail compliance check, called exactly once per Store.
*/
class GovernanceGate {
 public:
  virtual ~GovernanceGate() = default;

  virtual GovernanceVerdict Evaluate(const trustmem::v1::ProducerOutput& output) const = 0;
};

// Takes the producer's declared compliance and violations at face value.
class DeclaredComplianceGate final : public GovernanceGate {
 public:
  GovernanceVerdict Evaluate(const trustmem::v1::ProducerOutput& output) const override;
};

} // namespace trustmem::governance

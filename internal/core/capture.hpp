#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/core/memory_bank.hpp"
#include "internal/util/errors.hpp"
#include "trustmem/v1/memory.pb.h"

namespace trustmem::core {

struct CaptureOptions {
  // Raise ConstitutionalViolation when the stored output was flagged.
  bool reject_violations = false;
};

template <typename T>
struct Captured {
  T                       value;
  trustmem::v1::MemoryRef ref;
};

/*
  Auto-capture wrapper.

  Capture(bank, options, fn, mapper) returns a callable with fn's signature
  that runs fn, maps its result to a ProducerOutput, stores it and returns
  {value, ref}. The output is always persisted before a violation is raised,
  so the audit trail is complete even in strict mode.

    auto plan = core::Capture(bank, {}, MakePlan, [](const Plan& p) { return ToOutput(p); });
    auto [value, ref] = plan(goal);
*/
template <typename Fn, typename Mapper>
auto Capture(std::shared_ptr<MemoryBank> bank, CaptureOptions options, Fn fn, Mapper mapper) {
  if (!bank) {
    throw std::invalid_argument("Capture requires a memory bank");
  }

  return [bank = std::move(bank), options, fn = std::move(fn), mapper = std::move(mapper)](auto&&... args) {
    using Value = std::decay_t<std::invoke_result_t<const Fn&, decltype(args)...>>;

    Value                      value  = std::invoke(fn, std::forward<decltype(args)>(args)...);
    trustmem::v1::ProducerOutput output = std::invoke(mapper, std::as_const(value));
    auto                       ref    = bank->Store(output);

    if (options.reject_violations && ref.constitutional_violation()) {
      std::string reasons;
      for (const auto& violation : ref.violations()) {
        if (!reasons.empty()) reasons += "; ";
        reasons += violation;
      }
      throw util::ConstitutionalViolation("constitutional violation in " + output.component() + (reasons.empty() ? "" : ": " + reasons),
                                          ref.reference());
    }

    return Captured<Value>{std::move(value), std::move(ref)};
  };
}

} // namespace trustmem::core

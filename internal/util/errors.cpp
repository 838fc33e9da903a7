#include "errors.hpp"

namespace reel::util {

const char* ErrorKind(const std::exception& e) {
  if (dynamic_cast<const ConstraintViolation*>(&e)) {
    return "constraint_violation";
  }
  if (dynamic_cast<const ProbeFailure*>(&e)) {
    return "probe_failure";
  }
  if (dynamic_cast<const AdjustmentDivergence*>(&e)) {
    return "adjustment_divergence";
  }
  if (dynamic_cast<const ProviderTransient*>(&e)) {
    return "provider_transient";
  }
  if (dynamic_cast<const ProviderPermanent*>(&e)) {
    return "provider_permanent";
  }
  if (dynamic_cast<const MediaToolError*>(&e)) {
    return "media_tool";
  }
  if (dynamic_cast<const TaskTimeout*>(&e)) {
    return "timeout";
  }
  return "internal";
}

bool IsRetryable(const std::exception& e) {
  return dynamic_cast<const ProviderTransient*>(&e) != nullptr || dynamic_cast<const ProbeFailure*>(&e) != nullptr;
}

} // namespace reel::util

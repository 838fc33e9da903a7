#pragma once

#include <string>

#include "internal/media/edit_plan.hpp"

namespace reel::media {

struct ProbeResult {
  double      duration_seconds = 0.0;
  MediaKind   kind             = MediaKind::kUnknown;
  bool        has_audio        = false;
  bool        ok               = false;
  std::string error;
};

/*
  Reads duration and stream layout of a stored asset.

  Failure is reported through ok=false, never by throwing: callers decide
  whether to retry.
*/
class MediaProbe {
 public:
  virtual ~MediaProbe() = default;

  virtual ProbeResult Probe(const std::string& asset_ref) = 0;
};

} // namespace reel::media

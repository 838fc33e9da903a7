#pragma once

#include <string>

#include "internal/media/media_probe.hpp"
#include "internal/storage/asset_store.hpp"

namespace reel::media {

/*
  MediaProbe backed by the ffprobe CLI.

  Runs:
      ffprobe -v error -show_entries format=duration,format_name:stream=codec_type,duration -of json <file>
*/
class FfprobeMediaProbe final : public MediaProbe {
 public:
  FfprobeMediaProbe(storage::AssetStorePtr store, std::string ffprobe_path = "ffprobe");

  ProbeResult Probe(const std::string& asset_ref) override;

 private:
  storage::AssetStorePtr store_;
  std::string            ffprobe_path_;
};

// Interprets ffprobe JSON output. Exposed for tests.
ProbeResult ParseProbeJson(const std::string& json);

} // namespace reel::media

#include "ffprobe_media_probe.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "internal/media/process.hpp"
#include "reel/media/v1/probe.pb.h"

namespace reel::media {

namespace {

bool IsStillImageFormat(const std::string& format_name) {
  return format_name == "image2" || format_name.find("_pipe") != std::string::npos;
}

double ParseSeconds(const std::string& value) {
  if (value.empty() || value == "N/A") {
    return 0.0;
  }
  return std::stod(value);
}

} // namespace

FfprobeMediaProbe::FfprobeMediaProbe(storage::AssetStorePtr store, std::string ffprobe_path)
    : store_(std::move(store)), ffprobe_path_(std::move(ffprobe_path)) {
}

ProbeResult ParseProbeJson(const std::string& json) {
  ProbeResult result;

  reel::media::v1::ProbeOutput output;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &output, options);
  if (!status.ok()) {
    result.error = "unreadable ffprobe output: " + std::string(status.message());
    return result;
  }

  bool   has_video       = false;
  double stream_duration = 0.0;
  try {
    for (const auto& stream : output.streams()) {
      if (stream.codec_type() == "video") has_video = true;
      if (stream.codec_type() == "audio") result.has_audio = true;
      stream_duration = std::max(stream_duration, ParseSeconds(stream.duration()));
    }
    result.duration_seconds = ParseSeconds(output.format().duration());
  } catch (const std::exception& e) {
    result.error = std::string("bad duration field: ") + e.what();
    return result;
  }

  if (result.duration_seconds <= 0.0) {
    result.duration_seconds = stream_duration;
  }

  if (has_video) {
    result.kind = IsStillImageFormat(output.format().format_name()) ? MediaKind::kImage : MediaKind::kVideo;
  } else if (result.has_audio) {
    result.kind = MediaKind::kAudio;
  }

  if (result.kind == MediaKind::kUnknown) {
    result.error = "no audio or video streams";
    return result;
  }

  result.ok = true;
  return result;
}

ProbeResult FfprobeMediaProbe::Probe(const std::string& asset_ref) {
  ProbeResult failed;
  try {
    const auto path = store_->LocalPath(asset_ref);
    auto       run  = RunProcess({ffprobe_path_, "-v", "error", "-show_entries", "format=duration,format_name:stream=codec_type,duration",
                                  "-of", "json", path.string()});
    if (run.exit_code != 0) {
      failed.error = "ffprobe exited with " + std::to_string(run.exit_code) + ": " + run.output;
      return failed;
    }
    return ParseProbeJson(run.output);
  } catch (const std::exception& e) {
    failed.error = e.what();
    return failed;
  }
}

} // namespace reel::media

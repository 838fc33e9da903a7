#pragma once

#include <cstdint>
#include <string_view>

namespace reel::media {

enum class MediaKind : std::uint8_t {
  kUnknown = 0,
  kAudio   = 1,
  kVideo   = 2,
  kImage   = 3,
};

constexpr std::string_view ToString(MediaKind kind) {
  switch (kind) {
    case MediaKind::kAudio:
      return "audio";
    case MediaKind::kVideo:
      return "video";
    case MediaKind::kImage:
      return "image";
    default:
      return "unknown";
  }
}

enum class EditOperation : std::uint8_t {
  kNone          = 0,
  kTrim          = 1,
  kStretchAudio  = 2,
  kHoldLastFrame = 3,
};

enum class PitchMode : std::uint8_t {
  kPreserve = 0, // tempo change, spectral envelope kept
  kResample = 1, // plain resample, pitch shifts with speed
};

/*
  Declarative description of one duration edit. Produced by the planner,
  executed by a MediaEditor.

  For kStretchAudio the output length is input_duration / tempo.
  For kHoldLastFrame the final video frame is cloned for
  target_duration - input_duration seconds; the embedded audio track is
  stretched when stretch_embedded_audio is set and padded with silence
  otherwise.
*/
struct EditPlan {
  EditOperation op   = EditOperation::kNone;
  MediaKind     kind = MediaKind::kUnknown;

  double input_duration  = 0.0;
  double target_duration = 0.0;

  double fade_in_s  = 0.0;
  double fade_out_s = 0.0;

  double    tempo = 1.0;
  PitchMode pitch = PitchMode::kPreserve;

  bool has_audio              = false;
  bool stretch_embedded_audio = false;
};

} // namespace reel::media

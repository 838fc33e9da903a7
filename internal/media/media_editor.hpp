#pragma once

#include <string>
#include <vector>

#include "internal/media/edit_plan.hpp"

namespace reel::media {

/*
  Media transformations over stored assets. Inputs and outputs are asset
  references; outputs must already be reserved by the caller. All methods
  throw util::MediaToolError when the underlying tool fails.
*/
class MediaEditor {
 public:
  virtual ~MediaEditor() = default;

  virtual void Apply(const EditPlan& plan, const std::string& input, const std::string& output) = 0;

  // Speech at full level over music attenuated by music_gain.
  virtual void MixAudio(const std::string& speech, const std::string& music, double music_gain, const std::string& output) = 0;

  virtual void Mux(const std::string& video, const std::string& audio, const std::string& output) = 0;

  virtual void Concat(const std::vector<std::string>& inputs, const std::string& output) = 0;

  // Joins inputs with a video and audio crossfade of overlaps[i] seconds
  // between inputs i and i + 1. durations[i] is the length of inputs[i].
  virtual void CrossfadeConcat(const std::vector<std::string>& inputs, const std::vector<double>& durations,
                               const std::vector<double>& overlaps, const std::string& output) = 0;

  virtual void ExtractThumbnail(const std::string& video, double at_seconds, const std::string& output) = 0;
};

} // namespace reel::media

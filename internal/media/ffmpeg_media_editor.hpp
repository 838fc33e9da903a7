#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/media/media_editor.hpp"
#include "internal/storage/asset_store.hpp"

namespace reel::media {

/*
  MediaEditor that shells out to ffmpeg. Asset references are resolved to
  local paths through the AssetStore, so the store must be local.
*/
class FfmpegMediaEditor final : public MediaEditor {
 public:
  FfmpegMediaEditor(storage::AssetStorePtr store, std::string ffmpeg_path = "ffmpeg", std::filesystem::path scratch_dir = {});

  void Apply(const EditPlan& plan, const std::string& input, const std::string& output) override;
  void MixAudio(const std::string& speech, const std::string& music, double music_gain, const std::string& output) override;
  void Mux(const std::string& video, const std::string& audio, const std::string& output) override;
  void Concat(const std::vector<std::string>& inputs, const std::string& output) override;
  void CrossfadeConcat(const std::vector<std::string>& inputs, const std::vector<double>& durations, const std::vector<double>& overlaps,
                       const std::string& output) override;
  void ExtractThumbnail(const std::string& video, double at_seconds, const std::string& output) override;

  // atempo accepts factors in [0.5, 2.0]; larger changes are chained.
  static std::string AtempoChain(double tempo);

  // -filter_complex graph chaining xfade and acrossfade over the inputs;
  // the joined streams are labelled [v] and [a].
  static std::string CrossfadeFilter(const std::vector<double>& durations, const std::vector<double>& overlaps);

  // Full ffmpeg argv (without the binary) for an edit plan.
  static std::vector<std::string> BuildEditArgs(const EditPlan& plan, const std::string& input_path, const std::string& output_path);

 private:
  void Run(std::vector<std::string> args, const char* what);

  storage::AssetStorePtr store_;
  std::string            ffmpeg_path_;
  std::filesystem::path  scratch_dir_;
};

} // namespace reel::media

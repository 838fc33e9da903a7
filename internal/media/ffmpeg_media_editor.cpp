#include "ffmpeg_media_editor.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <fstream>

#include "internal/media/process.hpp"
#include "internal/timing/scene_transitions.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace reel::media {

namespace {

std::string Seconds(double value) {
  return fmt::format("{:.3f}", value);
}

std::string AudioFades(const EditPlan& plan) {
  std::vector<std::string> filters;
  if (plan.fade_in_s > 0.0) {
    filters.push_back(fmt::format("afade=t=in:st=0:d={}", Seconds(plan.fade_in_s)));
  }
  if (plan.fade_out_s > 0.0) {
    filters.push_back(fmt::format("afade=t=out:st={}:d={}", Seconds(plan.target_duration - plan.fade_out_s), Seconds(plan.fade_out_s)));
  }
  return fmt::format("{}", fmt::join(filters, ","));
}

std::string VideoFades(const EditPlan& plan) {
  std::vector<std::string> filters;
  if (plan.fade_in_s > 0.0) {
    filters.push_back(fmt::format("fade=t=in:st=0:d={}", Seconds(plan.fade_in_s)));
  }
  if (plan.fade_out_s > 0.0) {
    filters.push_back(fmt::format("fade=t=out:st={}:d={}", Seconds(plan.target_duration - plan.fade_out_s), Seconds(plan.fade_out_s)));
  }
  return fmt::format("{}", fmt::join(filters, ","));
}

std::string Resample(double tempo) {
  return fmt::format("aresample=44100,asetrate=44100*{},aresample=44100", fmt::format("{:.6f}", tempo));
}

} // namespace

FfmpegMediaEditor::FfmpegMediaEditor(storage::AssetStorePtr store, std::string ffmpeg_path, std::filesystem::path scratch_dir)
    : store_(std::move(store)), ffmpeg_path_(std::move(ffmpeg_path)), scratch_dir_(std::move(scratch_dir)) {
  if (scratch_dir_.empty()) {
    scratch_dir_ = std::filesystem::temp_directory_path();
  }
  std::filesystem::create_directories(scratch_dir_);
}

std::string FfmpegMediaEditor::AtempoChain(double tempo) {
  if (tempo <= 0.0) {
    throw util::InvalidArgument("tempo must be positive");
  }

  std::vector<std::string> stages;
  while (tempo > 2.0) {
    stages.emplace_back("atempo=2.0");
    tempo /= 2.0;
  }
  while (tempo < 0.5) {
    stages.emplace_back("atempo=0.5");
    tempo /= 0.5;
  }
  stages.push_back(fmt::format("atempo={:.6f}", tempo));
  stages.emplace_back("asetpts=PTS-STARTPTS");

  return fmt::format("{}", fmt::join(stages, ","));
}

std::vector<std::string> FfmpegMediaEditor::BuildEditArgs(const EditPlan& plan, const std::string& input_path, const std::string& output_path) {
  std::vector<std::string> args{"-y", "-hide_banner", "-i", input_path};

  switch (plan.op) {
    case EditOperation::kTrim: {
      args.insert(args.end(), {"-t", Seconds(plan.target_duration)});
      const auto afades = AudioFades(plan);
      if (plan.kind == MediaKind::kVideo) {
        const auto vfades = VideoFades(plan);
        if (!vfades.empty()) args.insert(args.end(), {"-vf", vfades});
        if (plan.has_audio && !afades.empty()) args.insert(args.end(), {"-af", afades});
        args.insert(args.end(), {"-c:v", "libx264", "-pix_fmt", "yuv420p"});
        if (plan.has_audio) args.insert(args.end(), {"-c:a", "aac"});
      } else {
        if (!afades.empty()) args.insert(args.end(), {"-af", afades});
      }
      break;
    }
    case EditOperation::kStretchAudio: {
      const auto filter = plan.pitch == PitchMode::kPreserve ? AtempoChain(plan.tempo) : Resample(plan.tempo);
      args.insert(args.end(), {"-filter:a", filter});
      break;
    }
    case EditOperation::kHoldLastFrame: {
      const double pad = plan.target_duration - plan.input_duration;
      args.insert(args.end(), {"-vf", fmt::format("tpad=stop_mode=clone:stop_duration={}", Seconds(pad))});
      if (plan.has_audio) {
        const auto filter = plan.stretch_embedded_audio ? AtempoChain(plan.input_duration / plan.target_duration)
                                                        : fmt::format("apad=whole_dur={}", Seconds(plan.target_duration));
        args.insert(args.end(), {"-af", filter, "-c:a", "aac"});
      }
      args.insert(args.end(), {"-c:v", "libx264", "-pix_fmt", "yuv420p", "-t", Seconds(plan.target_duration)});
      break;
    }
    case EditOperation::kNone:
      args.insert(args.end(), {"-c", "copy"});
      break;
  }

  args.push_back(output_path);
  return args;
}

void FfmpegMediaEditor::Run(std::vector<std::string> args, const char* what) {
  args.insert(args.begin(), {ffmpeg_path_, "-nostdin"});
  auto result = RunProcess(args);
  if (result.exit_code != 0) {
    throw util::MediaToolError(fmt::format("ffmpeg {} failed (exit {}): {}", what, result.exit_code, result.output));
  }
}

void FfmpegMediaEditor::Apply(const EditPlan& plan, const std::string& input, const std::string& output) {
  Run(BuildEditArgs(plan, store_->LocalPath(input).string(), store_->LocalPath(output).string()), "edit");
}

void FfmpegMediaEditor::MixAudio(const std::string& speech, const std::string& music, double music_gain, const std::string& output) {
  Run({"-y", "-hide_banner", "-i", store_->LocalPath(speech).string(), "-i", store_->LocalPath(music).string(), "-filter_complex",
       fmt::format("[1:a]volume={:.3f}[m];[0:a][m]amix=inputs=2:duration=first:dropout_transition=0", music_gain),
       store_->LocalPath(output).string()},
      "mix");
}

void FfmpegMediaEditor::Mux(const std::string& video, const std::string& audio, const std::string& output) {
  Run({"-y", "-hide_banner", "-i", store_->LocalPath(video).string(), "-i", store_->LocalPath(audio).string(), "-map", "0:v:0", "-map",
       "1:a:0", "-c:v", "copy", "-c:a", "aac", "-shortest", store_->LocalPath(output).string()},
      "mux");
}

void FfmpegMediaEditor::Concat(const std::vector<std::string>& inputs, const std::string& output) {
  if (inputs.empty()) {
    throw util::InvalidArgument("concat needs at least one input");
  }

  const auto list = scratch_dir_ / ("concat-" + util::NewId() + ".txt");
  {
    std::ofstream out(list);
    if (!out) {
      throw util::MediaToolError("cannot write concat list " + list.string());
    }
    for (const auto& ref : inputs) {
      out << "file '" << store_->LocalPath(ref).string() << "'\n";
    }
  }

  try {
    Run({"-y", "-hide_banner", "-f", "concat", "-safe", "0", "-i", list.string(), "-c", "copy", store_->LocalPath(output).string()}, "concat");
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(list, ec);
    throw;
  }

  std::error_code ec;
  std::filesystem::remove(list, ec);
}

std::string FfmpegMediaEditor::CrossfadeFilter(const std::vector<double>& durations, const std::vector<double>& overlaps) {
  const auto offsets = timing::TransitionOffsets(durations, overlaps);

  std::vector<std::string> chains;
  for (std::size_t i = 0; i < durations.size(); ++i) {
    chains.push_back(fmt::format("[{0}:v]settb=AVTB,setpts=PTS-STARTPTS[v{0}]", i));
  }

  std::string video = "v0";
  std::string audio = "0:a";
  for (std::size_t i = 0; i < overlaps.size(); ++i) {
    const bool        last       = i + 1 == overlaps.size();
    const std::string next_video = last ? "v" : fmt::format("vx{}", i + 1);
    const std::string next_audio = last ? "a" : fmt::format("ax{}", i + 1);
    chains.push_back(fmt::format("[{}][v{}]xfade=transition=fade:duration={}:offset={}[{}]", video, i + 1, Seconds(overlaps[i]),
                                 Seconds(offsets[i]), next_video));
    chains.push_back(fmt::format("[{}][{}:a]acrossfade=d={}[{}]", audio, i + 1, Seconds(overlaps[i]), next_audio));
    video = next_video;
    audio = next_audio;
  }
  return fmt::format("{}", fmt::join(chains, ";"));
}

void FfmpegMediaEditor::CrossfadeConcat(const std::vector<std::string>& inputs, const std::vector<double>& durations,
                                        const std::vector<double>& overlaps, const std::string& output) {
  if (inputs.size() < 2 || durations.size() != inputs.size()) {
    throw util::InvalidArgument("crossfade needs at least two inputs with known durations");
  }

  std::vector<std::string> args{"-y", "-hide_banner"};
  for (const auto& ref : inputs) {
    args.push_back("-i");
    args.push_back(store_->LocalPath(ref).string());
  }
  args.insert(args.end(), {"-filter_complex", CrossfadeFilter(durations, overlaps), "-map", "[v]", "-map", "[a]", "-c:v", "libx264",
                           "-pix_fmt", "yuv420p", "-c:a", "aac", store_->LocalPath(output).string()});
  Run(std::move(args), "crossfade");
}

void FfmpegMediaEditor::ExtractThumbnail(const std::string& video, double at_seconds, const std::string& output) {
  Run({"-y", "-hide_banner", "-ss", Seconds(at_seconds), "-i", store_->LocalPath(video).string(), "-frames:v", "1",
       store_->LocalPath(output).string()},
      "thumbnail");
}

} // namespace reel::media

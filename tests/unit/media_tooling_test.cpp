#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/media/ffmpeg_media_editor.hpp"
#include "internal/media/ffprobe_media_probe.hpp"
#include "internal/media/process.hpp"
#include "internal/util/errors.hpp"

namespace {

using reel::media::EditOperation;
using reel::media::EditPlan;
using reel::media::FfmpegMediaEditor;
using reel::media::MediaKind;
using reel::media::PitchMode;

bool Contains(const std::vector<std::string>& args, const std::string& value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

std::string After(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  assert(it != args.end() && it + 1 != args.end());
  return *(it + 1);
}

void TestAtempoChainWithinRange() {
  assert(FfmpegMediaEditor::AtempoChain(0.8) == "atempo=0.800000,asetpts=PTS-STARTPTS");
}

void TestAtempoChainSplitsLargeFactors() {
  assert(FfmpegMediaEditor::AtempoChain(0.25) == "atempo=0.5,atempo=0.500000,asetpts=PTS-STARTPTS");
  assert(FfmpegMediaEditor::AtempoChain(5.0) == "atempo=2.0,atempo=2.0,atempo=1.250000,asetpts=PTS-STARTPTS");

  bool threw = false;
  try {
    FfmpegMediaEditor::AtempoChain(0.0);
  } catch (const reel::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestTrimArgsUseTargetAndFades() {
  EditPlan plan;
  plan.op              = EditOperation::kTrim;
  plan.kind            = MediaKind::kAudio;
  plan.input_duration  = 10.0;
  plan.target_duration = 8.0;
  plan.fade_in_s       = 1.0;
  plan.fade_out_s      = 1.0;

  const auto args = FfmpegMediaEditor::BuildEditArgs(plan, "in.wav", "out.wav");
  assert(After(args, "-i") == "in.wav");
  assert(After(args, "-t") == "8.000");
  assert(After(args, "-af") == "afade=t=in:st=0:d=1.000,afade=t=out:st=7.000:d=1.000");
  assert(args.back() == "out.wav");
}

void TestVideoTrimReencodes() {
  EditPlan plan;
  plan.op              = EditOperation::kTrim;
  plan.kind            = MediaKind::kVideo;
  plan.target_duration = 4.0;
  plan.fade_out_s      = 1.0;
  plan.has_audio       = true;

  const auto args = FfmpegMediaEditor::BuildEditArgs(plan, "in.mp4", "out.mp4");
  assert(After(args, "-vf") == "fade=t=out:st=3.000:d=1.000");
  assert(After(args, "-c:v") == "libx264");
  assert(After(args, "-c:a") == "aac");
}

void TestStretchArgsFollowPitchMode() {
  EditPlan plan;
  plan.op    = EditOperation::kStretchAudio;
  plan.kind  = MediaKind::kAudio;
  plan.tempo = 0.8;

  auto args = FfmpegMediaEditor::BuildEditArgs(plan, "in.wav", "out.wav");
  assert(After(args, "-filter:a") == "atempo=0.800000,asetpts=PTS-STARTPTS");

  plan.pitch = PitchMode::kResample;
  args       = FfmpegMediaEditor::BuildEditArgs(plan, "in.wav", "out.wav");
  assert(After(args, "-filter:a") == "aresample=44100,asetrate=44100*0.800000,aresample=44100");
}

void TestHoldLastFrameArgsPadVideo() {
  EditPlan plan;
  plan.op                     = EditOperation::kHoldLastFrame;
  plan.kind                   = MediaKind::kVideo;
  plan.input_duration         = 3.0;
  plan.target_duration        = 5.0;
  plan.has_audio              = true;
  plan.stretch_embedded_audio = false;

  const auto args = FfmpegMediaEditor::BuildEditArgs(plan, "in.mp4", "out.mp4");
  assert(After(args, "-vf") == "tpad=stop_mode=clone:stop_duration=2.000");
  assert(After(args, "-af") == "apad=whole_dur=5.000");
  assert(After(args, "-t") == "5.000");
}

void TestNoOpCopiesStreams() {
  EditPlan plan;
  const auto args = FfmpegMediaEditor::BuildEditArgs(plan, "in.mp4", "out.mp4");
  assert(After(args, "-c") == "copy");
  assert(!Contains(args, "-t"));
}

void TestCrossfadeFilterChainsInputs() {
  const auto filter = FfmpegMediaEditor::CrossfadeFilter({5.0, 6.0, 4.0}, {1.0, 2.0});
  assert(filter ==
         "[0:v]settb=AVTB,setpts=PTS-STARTPTS[v0];"
         "[1:v]settb=AVTB,setpts=PTS-STARTPTS[v1];"
         "[2:v]settb=AVTB,setpts=PTS-STARTPTS[v2];"
         "[v0][v1]xfade=transition=fade:duration=1.000:offset=4.000[vx1];"
         "[0:a][1:a]acrossfade=d=1.000[ax1];"
         "[vx1][v2]xfade=transition=fade:duration=2.000:offset=8.000[v];"
         "[ax1][2:a]acrossfade=d=2.000[a]");
}

void TestParseProbeJsonAudio() {
  const auto result = reel::media::ParseProbeJson(R"({
    "streams": [{"codec_type": "audio", "duration": "4.992000"}],
    "format": {"format_name": "wav", "duration": "5.000000"}
  })");

  assert(result.ok);
  assert(result.kind == MediaKind::kAudio);
  assert(result.has_audio);
  assert(std::abs(result.duration_seconds - 5.0) < 1e-9);
}

void TestParseProbeJsonVideoFallsBackToStreamDuration() {
  const auto result = reel::media::ParseProbeJson(R"({
    "streams": [{"codec_type": "video", "duration": "3.500000"}, {"codec_type": "audio", "duration": "3.400000"}],
    "format": {"format_name": "mov,mp4,m4a,3gp,3g2,mj2", "duration": "N/A"}
  })");

  assert(result.ok);
  assert(result.kind == MediaKind::kVideo);
  assert(result.has_audio);
  assert(std::abs(result.duration_seconds - 3.5) < 1e-9);
}

void TestParseProbeJsonStillImage() {
  const auto result = reel::media::ParseProbeJson(R"({
    "streams": [{"codec_type": "video"}],
    "format": {"format_name": "png_pipe"}
  })");

  assert(result.ok);
  assert(result.kind == MediaKind::kImage);
}

void TestParseProbeJsonReportsFailures() {
  assert(!reel::media::ParseProbeJson("not json").ok);

  const auto empty = reel::media::ParseProbeJson(R"({"streams": [], "format": {"duration": "1.0"}})");
  assert(!empty.ok);
  assert(!empty.error.empty());
}

} // namespace

void TestChildReadsEmptyStdin() {
  // A child that reads stdin sees EOF immediately instead of blocking.
  const auto result = reel::media::RunProcess({"sh", "-c", "cat; read line; echo rc=$?"});
  assert(result.exit_code == 0);
  assert(result.output == "rc=1\n");
}

std::size_t CountChildFds() {
  const auto         result = reel::media::RunProcess({"ls", "/proc/self/fd"});
  std::istringstream in(result.output);
  std::size_t        count = 0;
  for (std::string line; std::getline(in, line);) {
    ++count;
  }
  return count;
}

void TestConcurrentChildrenDoNotInheritPipes() {
  const auto baseline = CountChildFds();

  // While the sleeper runs, its output pipe is open in this process.
  std::thread sleeper([] { reel::media::RunProcess({"sleep", "1"}); });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  const auto during = CountChildFds();
  sleeper.join();

  assert(during == baseline);
}

void TestMissingBinaryThrows() {
  bool threw = false;
  try {
    reel::media::RunProcess({"reel-no-such-tool"});
  } catch (const reel::util::MediaToolError&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  TestAtempoChainWithinRange();
  TestAtempoChainSplitsLargeFactors();
  TestTrimArgsUseTargetAndFades();
  TestVideoTrimReencodes();
  TestStretchArgsFollowPitchMode();
  TestHoldLastFrameArgsPadVideo();
  TestNoOpCopiesStreams();
  TestCrossfadeFilterChainsInputs();
  TestParseProbeJsonAudio();
  TestParseProbeJsonVideoFallsBackToStreamDuration();
  TestParseProbeJsonStillImage();
  TestParseProbeJsonReportsFailures();
  TestChildReadsEmptyStdin();
  TestConcurrentChildrenDoNotInheritPipes();
  TestMissingBinaryThrows();

  std::cout << "reel_unit_media_tooling: pass\n";
  return 0;
}

#pragma once

#include <cstdint>
#include <string>

namespace reel::db::model {

// One scene of a task, keyed by (task_id, index).
struct SceneRecord {
  std::string task_id;
  uint32_t    index = 0;

  std::string title;
  std::string script_text;
  std::string visual_prompt;
  std::string audio_prompt;
  std::string music_prompt;

  double weight          = 1.0;
  double target_duration = 0.0;
  double actual_duration = 0.0;

  // Asset references, empty until produced.
  std::string image_ref;
  std::string speech_ref;
  std::string music_ref;
  std::string mixed_audio_ref;
  std::string video_ref;
  std::string final_scene_ref;
};

} // namespace reel::db::model

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace reel::model {

enum class AssetSlot : std::uint8_t {
  kImage      = 0,
  kSpeech     = 1,
  kMusic      = 2,
  kMixedAudio = 3,
  kVideo      = 4,
  kFinalScene = 5,
};

inline constexpr std::size_t kAssetSlotCount = 6;

inline constexpr std::array<std::string_view, kAssetSlotCount> kAssetSlotNames = {
    "image", "speech", "music", "mixed_audio", "video", "final_scene",
};

constexpr std::string_view ToString(AssetSlot slot) {
  return kAssetSlotNames[static_cast<std::size_t>(slot)];
}

/*
  One narrative unit of a task.

  Content descriptors are immutable once the scene list is produced.
  Each asset slot is written at most once; an empty string means unset.
*/
struct Scene {
  std::uint32_t index = 0;

  std::string title;
  std::string script_text;
  std::string visual_prompt;
  std::string audio_prompt;
  std::string music_prompt;

  double weight          = 1.0;
  double target_duration = 0.0;
  double actual_duration = 0.0;

  std::array<std::string, kAssetSlotCount> assets;

  const std::string& Asset(AssetSlot slot) const {
    return assets[static_cast<std::size_t>(slot)];
  }

  bool HasAsset(AssetSlot slot) const {
    return !Asset(slot).empty();
  }
};

} // namespace reel::model

#pragma once

#include <string>
#include <string_view>

namespace reel::storage {

/*
  Reference layout used by the bundled stores:

      asset://<uuid>.<ext>
*/

inline constexpr std::string_view kAssetScheme = "asset://";

std::string MakeAssetRef(std::string_view extension);

// File name component of a reference. Throws std::invalid_argument for
// anything that is not a well-formed reference.
std::string AssetFileName(const std::string& ref);

std::string AssetExtension(const std::string& ref);

} // namespace reel::storage

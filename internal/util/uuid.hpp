#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace reel::util {

/*
  UUID helpers

  Task ids and asset names are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace reel::util

#include "asset_ref.hpp"

#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace reel::storage {

namespace {

void ValidateExtension(std::string_view extension) {
  if (extension.empty() || extension.size() > 8) {
    throw std::invalid_argument("asset extension must be 1-8 characters");
  }
  for (char c : extension) {
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (!alnum) {
      throw std::invalid_argument("asset extension contains invalid character");
    }
  }
}

} // namespace

std::string MakeAssetRef(std::string_view extension) {
  ValidateExtension(extension);
  return std::string(kAssetScheme) + util::NewId() + "." + std::string(extension);
}

std::string AssetFileName(const std::string& ref) {
  if (ref.rfind(kAssetScheme, 0) != 0) {
    throw std::invalid_argument("not an asset reference: " + ref);
  }
  auto name = ref.substr(kAssetScheme.size());
  if (name.empty() || name == "." || name == "..") {
    throw std::invalid_argument("asset reference has empty name");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("asset reference contains invalid character");
    }
  }
  return name;
}

std::string AssetExtension(const std::string& ref) {
  auto name = AssetFileName(ref);
  auto dot  = name.rfind('.');
  if (dot == std::string::npos || dot + 1 == name.size()) {
    throw std::invalid_argument("asset reference has no extension: " + ref);
  }
  auto extension = name.substr(dot + 1);
  ValidateExtension(extension);
  return extension;
}

} // namespace reel::storage

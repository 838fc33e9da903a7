#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace reel::storage {

/*
  Opaque binary asset storage.

  References returned by this interface are opaque to callers: they are
  passed around, persisted and handed back, never parsed outside the
  storage layer.

  Media tools operate on files, so every store must be able to expose a
  local path for a reference (LocalPath) and hand out references whose
  path a tool may write into (Reserve / ReserveSibling).
*/

class AssetStore {
 public:
  virtual ~AssetStore() = default;

  virtual std::string Put(const std::string& bytes, std::string_view extension) = 0;

  virtual std::string Get(const std::string& ref) = 0;

  // Fresh reference with no content yet.
  virtual std::string Reserve(std::string_view extension) = 0;

  // Fresh reference of the same media type as ref.
  virtual std::string ReserveSibling(const std::string& ref) = 0;

  virtual std::filesystem::path LocalPath(const std::string& ref) = 0;

  virtual bool Exists(const std::string& ref) = 0;

  virtual void Remove(const std::string& ref) = 0;
};

using AssetStorePtr = std::shared_ptr<AssetStore>;

} // namespace reel::storage

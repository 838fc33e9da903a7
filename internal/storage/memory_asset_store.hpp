#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/asset_store.hpp"

namespace reel::storage {

/*
  Process-local asset store. Used by tests and by media collaborators that
  never touch real files; LocalPath() is not supported.
*/
class MemoryAssetStore final : public AssetStore {
 public:
  std::string Put(const std::string& bytes, std::string_view extension) override;
  std::string Get(const std::string& ref) override;
  std::string Reserve(std::string_view extension) override;
  std::string ReserveSibling(const std::string& ref) override;
  std::filesystem::path LocalPath(const std::string& ref) override;
  bool Exists(const std::string& ref) override;
  void Remove(const std::string& ref) override;

  std::size_t Size() const;

 private:
  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, std::string> objects_;
};

} // namespace reel::storage

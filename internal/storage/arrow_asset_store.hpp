#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <filesystem>
#include <memory>
#include <string>

#include "internal/storage/asset_store.hpp"

namespace reel::storage {

/*
  Asset storage on an Arrow filesystem.

  Root may be a local directory or any URI Arrow understands (file://,
  s3://, ...). Writes go to <name>.tmp then get moved into place.
  LocalPath() is only available for local filesystems since media tools
  read and write plain files.
*/

class ArrowAssetStore final : public AssetStore {
 public:
  explicit ArrowAssetStore(const std::string& root, bool fsync = false);

  std::string Put(const std::string& bytes, std::string_view extension) override;
  std::string Get(const std::string& ref) override;
  std::string Reserve(std::string_view extension) override;
  std::string ReserveSibling(const std::string& ref) override;
  std::filesystem::path LocalPath(const std::string& ref) override;
  bool Exists(const std::string& ref) override;
  void Remove(const std::string& ref) override;

  std::shared_ptr<arrow::Buffer> ReadBuffer(const std::string& ref);

 private:
  std::string ObjectPath(const std::string& ref) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  bool                                   local_ = false;
  bool                                   fsync_ = false;
};

} // namespace reel::storage

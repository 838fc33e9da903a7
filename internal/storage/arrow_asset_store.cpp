#include "arrow_asset_store.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>

#include "internal/storage/asset_ref.hpp"
#include "internal/util/errors.hpp"

namespace reel::storage {

namespace {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

} // namespace

ArrowAssetStore::ArrowAssetStore(const std::string& root, bool fsync) : fsync_(fsync) {
  // Arrow only accepts absolute local paths.
  const auto location = root.find("://") == std::string::npos ? std::filesystem::absolute(root).string() : root;
  fs_    = Unwrap(arrow::fs::FileSystemFromUriOrPath(location, &root_path_));
  local_ = fs_->type_name() == "local";
  Unwrap(fs_->CreateDir(root_path_, /*recursive=*/true));
}

/*
  Object layout:

      <root>/<uuid>.<ext>
*/
std::string ArrowAssetStore::ObjectPath(const std::string& ref) const {
  const auto name = AssetFileName(ref);
  if (!root_path_.empty() && root_path_.back() == '/') {
    return root_path_ + name;
  }
  return root_path_ + "/" + name;
}

std::string ArrowAssetStore::Put(const std::string& bytes, std::string_view extension) {
  auto ref        = MakeAssetRef(extension);
  auto final_path = ObjectPath(ref);
  auto tmp_path   = final_path + ".tmp";

  {
    auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));
    if (fsync_) Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  Unwrap(fs_->Move(tmp_path, final_path));
  return ref;
}

std::shared_ptr<arrow::Buffer> ArrowAssetStore::ReadBuffer(const std::string& ref) {
  auto path = ObjectPath(ref);
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("asset not found: " + ref);
  }
  auto input = Unwrap(fs_->OpenInputFile(path));
  auto size  = Unwrap(input->GetSize());
  return Unwrap(input->Read(size));
}

std::string ArrowAssetStore::Get(const std::string& ref) {
  return ReadBuffer(ref)->ToString();
}

std::string ArrowAssetStore::Reserve(std::string_view extension) {
  return MakeAssetRef(extension);
}

std::string ArrowAssetStore::ReserveSibling(const std::string& ref) {
  return MakeAssetRef(AssetExtension(ref));
}

std::filesystem::path ArrowAssetStore::LocalPath(const std::string& ref) {
  if (!local_) {
    throw util::InvalidState("asset store on " + fs_->type_name() + " has no local paths");
  }
  return std::filesystem::path(ObjectPath(ref));
}

bool ArrowAssetStore::Exists(const std::string& ref) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(ref)));
  return info.type() == arrow::fs::FileType::File;
}

void ArrowAssetStore::Remove(const std::string& ref) {
  if (Exists(ref)) {
    Unwrap(fs_->DeleteFile(ObjectPath(ref)));
  }
}

} // namespace reel::storage

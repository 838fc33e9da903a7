#include "memory_asset_store.hpp"

#include "internal/storage/asset_ref.hpp"
#include "internal/util/errors.hpp"

namespace reel::storage {

std::string MemoryAssetStore::Put(const std::string& bytes, std::string_view extension) {
  auto             ref = MakeAssetRef(extension);
  std::scoped_lock lock(mutex_);
  objects_[ref] = bytes;
  return ref;
}

std::string MemoryAssetStore::Get(const std::string& ref) {
  std::scoped_lock lock(mutex_);
  auto             it = objects_.find(ref);
  if (it == objects_.end()) {
    throw util::NotFound("asset not found: " + ref);
  }
  return it->second;
}

std::string MemoryAssetStore::Reserve(std::string_view extension) {
  return MakeAssetRef(extension);
}

std::string MemoryAssetStore::ReserveSibling(const std::string& ref) {
  return MakeAssetRef(AssetExtension(ref));
}

std::filesystem::path MemoryAssetStore::LocalPath(const std::string& ref) {
  throw util::InvalidState("memory asset store has no local path for " + ref);
}

bool MemoryAssetStore::Exists(const std::string& ref) {
  std::scoped_lock lock(mutex_);
  return objects_.contains(ref);
}

void MemoryAssetStore::Remove(const std::string& ref) {
  std::scoped_lock lock(mutex_);
  objects_.erase(ref);
}

std::size_t MemoryAssetStore::Size() const {
  std::scoped_lock lock(mutex_);
  return objects_.size();
}

} // namespace reel::storage

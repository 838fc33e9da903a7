#include "cancellation_registry.hpp"

namespace reel::runner {

util::CancellationTokenPtr CancellationRegistry::Register(const std::string& task_id) {
  std::scoped_lock lock(mutex_);
  auto&            token = tokens_[task_id];
  if (!token) {
    token = std::make_shared<util::CancellationToken>();
  }
  return token;
}

util::CancellationTokenPtr CancellationRegistry::Find(const std::string& task_id) const {
  std::scoped_lock lock(mutex_);
  auto             it = tokens_.find(task_id);
  return it == tokens_.end() ? nullptr : it->second;
}

bool CancellationRegistry::Cancel(const std::string& task_id) {
  auto token = Find(task_id);
  if (!token) {
    return false;
  }
  token->Cancel();
  return true;
}

void CancellationRegistry::Remove(const std::string& task_id) {
  std::scoped_lock lock(mutex_);
  tokens_.erase(task_id);
}

std::size_t CancellationRegistry::Size() const {
  std::scoped_lock lock(mutex_);
  return tokens_.size();
}

} // namespace reel::runner

/**
 * @file scan_source.cpp
 * @brief Cancellation token and source registry
 */

#include "btcatalog/scan_source.h"
#include <condition_variable>
#include <mutex>

namespace btcatalog {

// ============================================================================
// CancellationToken
// ============================================================================

struct CancellationToken::State {
  mutable std::mutex mutex;
  mutable std::condition_variable cv;
  bool cancelled = false;
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout,
                             [this] { return state_->cancelled; });
}

// ============================================================================
// SourceRegistry
// ============================================================================

Result<void> SourceRegistry::add(ScanSourcePtr source) {
  if (!source) {
    return Error(ErrorCode::InvalidArgument, "Cannot register a null source");
  }

  std::string id = source->id();
  if (id.empty()) {
    return Error(ErrorCode::InvalidArgument, "Source id cannot be empty");
  }
  if (contains(id)) {
    return Error(ErrorCode::DuplicateSource, "Source already registered", id);
  }

  sources_.push_back(std::move(source));
  return Result<void>::ok();
}

ScanSourcePtr SourceRegistry::find(const std::string &id) const {
  for (const auto &source : sources_) {
    if (source->id() == id) {
      return source;
    }
  }
  return nullptr;
}

bool SourceRegistry::contains(const std::string &id) const {
  return find(id) != nullptr;
}

std::vector<std::string> SourceRegistry::ids() const {
  std::vector<std::string> result;
  result.reserve(sources_.size());
  for (const auto &source : sources_) {
    result.push_back(source->id());
  }
  return result;
}

} // namespace btcatalog

#include "core/cancel_token.h"

#include <algorithm>

namespace fanout::core {

CancelToken::~CancelToken() {
  if (parent_registration_ == kAlreadyInvoked) {
    return;
  }
  if (auto parent = parent_.lock()) {
    parent->remove_callback(parent_registration_);
  }
}

void CancelToken::cancel(std::string reason) {
  std::vector<std::pair<CallbackId, Callback>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_relaxed)) {
      return;
    }
    reason_ = reason.empty() ? std::string("cancelled") : std::move(reason);
    cancelled_.store(true, std::memory_order_release);
    pending.swap(callbacks_);
  }
  cv_.notify_all();

  // Outside the lock: callbacks may touch this token or derive new ones.
  for (auto &[id, cb] : pending) {
    (void)id;
    if (cb) {
      cb();
    }
  }
}

bool CancelToken::is_cancelled() const noexcept {
  return cancelled_.load(std::memory_order_acquire);
}

std::string CancelToken::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

Result<void, TaskError> CancelToken::check() const {
  if (!is_cancelled()) {
    return Result<void, TaskError>::Ok();
  }
  const std::string why = reason();
  TaskError err = TaskError::Cancelled("Operation cancelled: " + why);
  if (why == kDeadlineReason) {
    err.code = error_code::kDeadlineExceeded;
  }
  err.details["reason"] = why;
  return Result<void, TaskError>::Err(std::move(err));
}

CancelToken::CallbackId CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load(std::memory_order_relaxed)) {
      const CallbackId id = next_id_++;
      callbacks_.emplace_back(id, std::move(cb));
      return id;
    }
  }
  // Already cancelled: invoke immediately
  if (cb) {
    cb();
  }
  return kAlreadyInvoked;
}

void CancelToken::remove_callback(CallbackId id) {
  if (id == kAlreadyInvoked) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const auto &entry) {
                                    return entry.first == id;
                                  }),
                   callbacks_.end());
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() {
    return cancelled_.load(std::memory_order_relaxed);
  });
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

std::shared_ptr<CancelToken>
CancelToken::derive_child(const std::shared_ptr<CancelToken> &parent) {
  auto child = create();
  if (!parent) {
    return child;
  }

  std::weak_ptr<CancelToken> weak_child = child;
  std::weak_ptr<CancelToken> weak_parent = parent;
  const CallbackId id = parent->on_cancel([weak_child, weak_parent]() {
    auto c = weak_child.lock();
    if (!c) {
      return;
    }
    auto p = weak_parent.lock();
    c->cancel(p ? p->reason() : std::string("parent cancelled"));
  });

  child->parent_ = parent;
  child->parent_registration_ = id;
  return child;
}

Deadline::Deadline(const std::shared_ptr<CancelToken> &parent,
                   std::chrono::milliseconds timeout)
    : token_(CancelToken::derive_child(parent)),
      stop_(CancelToken::derive_child(token_)) {
  timer_ = std::thread([token = token_, stop = stop_, timeout, this]() {
    // stop_ is a child of token_, so an external cancel also ends the wait.
    if (!stop->wait_for(timeout)) {
      expired_.store(true, std::memory_order_release);
      token->cancel(kDeadlineReason);
    }
  });
}

Deadline::~Deadline() {
  stop_->cancel("deadline disposed");
  if (timer_.joinable()) {
    timer_.join();
  }
}

} // namespace fanout::core

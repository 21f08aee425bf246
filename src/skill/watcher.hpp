#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

#include "core/types.hpp"

namespace skillhub::skill {

// Watches a skill tree (root, agents/, skills/, every skill directory and its
// resources/) and invokes the callback once per burst of filesystem events.
// The callback runs on the watcher's own thread and must not call stop().
class ChangeWatcher {
 public:
  using Callback = std::function<void()>;

  explicit ChangeWatcher(std::chrono::milliseconds debounce = std::chrono::milliseconds(200));
  ~ChangeWatcher();

  ChangeWatcher(const ChangeWatcher &) = delete;
  ChangeWatcher &operator=(const ChangeWatcher &) = delete;

  // Fails if already running or if the root cannot be watched
  Result<bool> start(const std::filesystem::path &root, Callback on_change);

  // Idempotent; safe to call when never started
  void stop();

  bool running() const;

  std::chrono::milliseconds debounce() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace skillhub::skill

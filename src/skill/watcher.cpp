#include "skill/watcher.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <asio.hpp>
#include <asio/steady_timer.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

#include "skill/scanner.hpp"

#ifdef __linux__
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#endif

namespace skillhub::skill {

namespace fs = std::filesystem;

#ifdef __linux__

// ============================================================
// ChangeWatcher::Impl — inotify + asio
// ============================================================

class ChangeWatcher::Impl {
 public:
  explicit Impl(std::chrono::milliseconds debounce) : debounce_(debounce) {}

  ~Impl() {
    stop();
  }

  Result<bool> start(const fs::path &root, Callback on_change) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
      return Result<bool>::failure(ErrorKind::WatchUnavailable, root, "watcher already running");
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      return Result<bool>::failure(ErrorKind::UnreadableRoot, root, "not a directory");
    }

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
      return Result<bool>::failure(ErrorKind::WatchUnavailable, root, std::string("inotify_init1 failed: ") + strerror(errno));
    }

    root_ = root;
    on_change_ = std::move(on_change);
    watches_.clear();

    io_.restart();
    stream_.emplace(io_, fd);  // Takes ownership of fd

    if (!add_watch(root_)) {
      stream_.reset();
      return Result<bool>::failure(ErrorKind::UnreadableRoot, root, "cannot watch root directory");
    }
    refresh_watches();

    running_ = true;
    read_next();

    thread_ = std::thread([this]() {
      io_.run();
    });

    spdlog::info("[watch] Watching {} ({} directories, debounce {}ms)", root_.string(), watches_.size(), debounce_.count());
    return Result<bool>::success(true);
  }

  void stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!running_.exchange(false)) return;

    asio::post(io_, [this]() {
      timer_.cancel();
      if (stream_) {
        std::error_code ec;
        stream_->close(ec);
      }
    });

    if (thread_.joinable()) {
      thread_.join();
    }

    // The io thread may have exited before running the close handler
    io_.restart();
    io_.poll();

    stream_.reset();
    watches_.clear();
    spdlog::info("[watch] Stopped watching {}", root_.string());
  }

  bool running() const {
    return running_;
  }

  std::chrono::milliseconds debounce() const {
    return debounce_;
  }

 private:
  static constexpr uint32_t kMask =
      IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE | IN_DELETE_SELF | IN_MOVE_SELF | IN_ATTRIB;

  bool add_watch(const fs::path &dir) {
    int wd = inotify_add_watch(stream_->native_handle(), dir.c_str(), kMask | IN_ONLYDIR);
    if (wd < 0) {
      spdlog::debug("[watch] Cannot watch {}: {}", dir.string(), strerror(errno));
      return false;
    }
    watches_[wd] = dir;
    return true;
  }

  // Add watches for every directory that can contain descriptors or resources.
  // inotify_add_watch on an already watched directory returns the same descriptor.
  void refresh_watches() {
    std::error_code ec;
    for (const char *sub : {kAgentsDir, kSkillsDir}) {
      auto dir = root_ / sub;
      if (fs::is_directory(dir, ec)) add_watch(dir);
    }

    auto skills_dir = root_ / kSkillsDir;
    if (!fs::is_directory(skills_dir, ec)) return;

    fs::directory_iterator it(skills_dir, ec);
    if (ec) return;
    for (auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
      if (ec) break;
      if (!it->is_directory(ec)) continue;
      add_watch(it->path());
      auto resources = it->path() / kResourcesDir;
      if (fs::is_directory(resources, ec)) add_watch(resources);
    }
  }

  void read_next() {
    stream_->async_read_some(asio::buffer(buffer_), [this](std::error_code ec, std::size_t n) {
      if (ec) {
        if (ec != asio::error::operation_aborted) {
          spdlog::error("[watch] Read failed: {}", ec.message());
        }
        return;
      }
      handle_events(n);
      read_next();
    });
  }

  void handle_events(std::size_t n) {
    bool relevant = false;

    for (std::size_t offset = 0; offset + sizeof(inotify_event) <= n;) {
      const auto *event = reinterpret_cast<const inotify_event *>(buffer_.data() + offset);
      offset += sizeof(inotify_event) + event->len;

      if (event->mask & IN_Q_OVERFLOW) {
        spdlog::warn("[watch] Event queue overflow, forcing rescan");
        relevant = true;
        continue;
      }
      if (event->mask & IN_IGNORED) {
        watches_.erase(event->wd);
        continue;
      }

      auto it = watches_.find(event->wd);
      fs::path path = it == watches_.end() ? fs::path() : it->second;
      if (event->len > 0) path /= event->name;
      spdlog::trace("[watch] Event 0x{:x} on {}", event->mask, path.string());

      if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
        refresh_watches();
      }
      relevant = true;
    }

    if (relevant) arm_timer();
  }

  // Quiet-period debounce: every event pushes the deadline back
  void arm_timer() {
    timer_.expires_after(debounce_);
    timer_.async_wait([this](std::error_code ec) {
      if (ec) return;  // Re-armed or cancelled
      refresh_watches();
      if (!on_change_) return;
      try {
        on_change_();
      } catch (const std::exception &e) {
        spdlog::error("[watch] Change handler failed: {}", e.what());
      }
    });
  }

  std::chrono::milliseconds debounce_;
  fs::path root_;
  Callback on_change_;

  asio::io_context io_;
  asio::steady_timer timer_{io_};
  std::optional<asio::posix::stream_descriptor> stream_;
  std::thread thread_;
  std::map<int, fs::path> watches_;  // Touched on the io thread once running
  alignas(inotify_event) std::array<char, 16 * 1024> buffer_{};

  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
};

#else

class ChangeWatcher::Impl {
 public:
  explicit Impl(std::chrono::milliseconds debounce) : debounce_(debounce) {}

  Result<bool> start(const fs::path &root, Callback) {
    spdlog::error("[watch] Filesystem watching is only implemented on Linux");
    return Result<bool>::failure(ErrorKind::WatchUnavailable, root, "filesystem watching not supported on this platform");
  }

  void stop() {}

  bool running() const {
    return false;
  }

  std::chrono::milliseconds debounce() const {
    return debounce_;
  }

 private:
  std::chrono::milliseconds debounce_;
};

#endif

// ============================================================
// ChangeWatcher
// ============================================================

ChangeWatcher::ChangeWatcher(std::chrono::milliseconds debounce) : impl_(std::make_unique<Impl>(debounce)) {}

ChangeWatcher::~ChangeWatcher() {
  stop();
}

Result<bool> ChangeWatcher::start(const fs::path &root, Callback on_change) {
  return impl_->start(root, std::move(on_change));
}

void ChangeWatcher::stop() {
  impl_->stop();
}

bool ChangeWatcher::running() const {
  return impl_->running();
}

std::chrono::milliseconds ChangeWatcher::debounce() const {
  return impl_->debounce();
}

}  // namespace skillhub::skill

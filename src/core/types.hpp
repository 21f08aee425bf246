#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace skillhub {

// Error and warning taxonomy. Everything except UnreadableRoot and
// WatchUnavailable is per-file or per-query and never aborts a scan or reload.
enum class ErrorKind {
  MalformedHeader,
  MissingField,
  InvalidName,
  EmptyCategories,
  NameMismatch,
  DescriptionTooLong,
  UnreadableFile,
  MissingDescriptor,
  DuplicateName,
  NoMatchForCategory,
  UnreadableRoot,
  WatchUnavailable,  // Watcher already running, or no inotify on this platform
};

std::string to_string(ErrorKind kind);

// A single error/warning record tied to a file (or a category, for query notes)
struct Diagnostic {
  ErrorKind kind = ErrorKind::MalformedHeader;
  std::filesystem::path path;
  std::string message;

  std::string describe() const;
};

// Operation result: either a value or a diagnostic
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Diagnostic> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(Diagnostic d) {
    Result r;
    r.error = std::move(d);
    return r;
  }

  static Result failure(ErrorKind kind, std::filesystem::path path, std::string message) {
    return failure(Diagnostic{kind, std::move(path), std::move(message)});
  }
};

using Diagnostics = std::vector<Diagnostic>;

}  // namespace skillhub

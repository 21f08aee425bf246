#include "core/types.hpp"

namespace skillhub {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedHeader:
      return "MalformedHeaderError";
    case ErrorKind::MissingField:
      return "MissingFieldError";
    case ErrorKind::InvalidName:
      return "InvalidNameError";
    case ErrorKind::EmptyCategories:
      return "EmptyCategoriesError";
    case ErrorKind::NameMismatch:
      return "NameMismatchError";
    case ErrorKind::DescriptionTooLong:
      return "DescriptionTooLongError";
    case ErrorKind::UnreadableFile:
      return "UnreadableFileError";
    case ErrorKind::MissingDescriptor:
      return "MissingDescriptorError";
    case ErrorKind::DuplicateName:
      return "DuplicateNameWarning";
    case ErrorKind::NoMatchForCategory:
      return "NoMatchForCategory";
    case ErrorKind::UnreadableRoot:
      return "UnreadableRootError";
    case ErrorKind::WatchUnavailable:
      return "WatchUnavailableError";
  }
  return "Unknown";
}

std::string Diagnostic::describe() const {
  std::string out = to_string(kind);
  if (!path.empty()) {
    out += " (" + path.string() + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

}  // namespace skillhub

#include <gtest/gtest.h>

#include <string>

#include "core/types.hpp"

using namespace skillhub;

// --- ResultTest ---

TEST(ResultTest, Success) {
  auto result = Result<int>::success(42);

  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.failed());
  ASSERT_TRUE(result.value.has_value());
  EXPECT_EQ(*result.value, 42);
  EXPECT_FALSE(result.error.has_value());
}

TEST(ResultTest, Failure) {
  auto result = Result<int>::failure(ErrorKind::MissingField, "/tmp/x/SKILL.md", "missing required 'name' field");

  EXPECT_FALSE(result.ok());
  EXPECT_TRUE(result.failed());
  EXPECT_FALSE(result.value.has_value());
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::MissingField);
  EXPECT_EQ(result.error->path, "/tmp/x/SKILL.md");
}

TEST(ResultTest, DefaultState) {
  Result<std::string> result;

  EXPECT_FALSE(result.ok());
  EXPECT_FALSE(result.failed());
}

// --- DiagnosticTest ---

TEST(DiagnosticTest, KindNames) {
  EXPECT_EQ(to_string(ErrorKind::MalformedHeader), "MalformedHeaderError");
  EXPECT_EQ(to_string(ErrorKind::NameMismatch), "NameMismatchError");
  EXPECT_EQ(to_string(ErrorKind::EmptyCategories), "EmptyCategoriesError");
  EXPECT_EQ(to_string(ErrorKind::DuplicateName), "DuplicateNameWarning");
  EXPECT_EQ(to_string(ErrorKind::NoMatchForCategory), "NoMatchForCategory");
  EXPECT_EQ(to_string(ErrorKind::UnreadableRoot), "UnreadableRootError");
  EXPECT_EQ(to_string(ErrorKind::WatchUnavailable), "WatchUnavailableError");
}

TEST(DiagnosticTest, Describe) {
  Diagnostic d{ErrorKind::InvalidName, "/skills/Foo/SKILL.md", "invalid name 'Foo'"};
  EXPECT_EQ(d.describe(), "InvalidNameError (/skills/Foo/SKILL.md): invalid name 'Foo'");

  Diagnostic note{ErrorKind::NoMatchForCategory, {}, "no skill for category 'mocking'"};
  EXPECT_EQ(note.describe(), "NoMatchForCategory: no skill for category 'mocking'");
}

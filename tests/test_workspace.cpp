/**
 * @file test_workspace.cpp
 * @brief Tests for workspace.hpp and fs.hpp
 */

#include "itest/workspace.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

static std::string MakeTempDir() {
  char tmpl[] = "/tmp/itest-ws-test-XXXXXX";
  REQUIRE(mkdtemp(tmpl) != nullptr);
  return tmpl;
}

static void Touch(const std::string& path, const char* text) {
  FILE* f = std::fopen(path.c_str(), "w");
  REQUIRE(f != nullptr);
  std::fputs(text, f);
  std::fclose(f);
}

static void RemoveTree(const std::string& path) {
  std::string cmd = "rm -rf '" + path + "'";
  REQUIRE(std::system(cmd.c_str()) == 0);
}

// ============================================================================
// fs helpers
// ============================================================================

TEST_CASE("BaseName", "[workspace][fs]") {
  REQUIRE(itest::detail::BaseName("/a/b/c.case") == "c.case");
  REQUIRE(itest::detail::BaseName("/a/b/") == "b");
  REQUIRE(itest::detail::BaseName("name") == "name");
}

TEST_CASE("MakeDirs creates nested directories", "[workspace][fs]") {
  const std::string root = MakeTempDir();
  const std::string deep = root + "/a/b/c";
  REQUIRE(itest::detail::MakeDirs(deep));
  REQUIRE(itest::detail::IsDirectory(deep));
  REQUIRE(itest::detail::MakeDirs(deep));
  RemoveTree(root);
}

TEST_CASE("CopyTree copies files and directories", "[workspace][fs]") {
  const std::string root = MakeTempDir();
  REQUIRE(itest::detail::MakeDirs(root + "/src/sub"));
  Touch(root + "/src/a.txt", "A");
  Touch(root + "/src/sub/b.txt", "B");

  REQUIRE(itest::detail::CopyTree(root + "/src", root + "/dst"));
  REQUIRE(itest::detail::IsRegularFile(root + "/dst/a.txt"));
  REQUIRE(itest::detail::IsRegularFile(root + "/dst/sub/b.txt"));
  REQUIRE_FALSE(itest::detail::CopyTree(root + "/missing", root + "/x"));
  RemoveTree(root);
}

// ============================================================================
// TempWorkspace
// ============================================================================

TEST_CASE("TempWorkspace hands out fresh directories", "[workspace]") {
  const std::string root = MakeTempDir();
  itest::TempWorkspace ws(root);

  auto a = ws.NewRunDirectory("", "/tmp", {});
  auto b = ws.NewRunDirectory("", "/tmp", {});
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a.value() != b.value());
  REQUIRE(a.value().compare(0, root.size() + 9, root + "/default/") == 0);
  REQUIRE(itest::detail::ListDir(a.value()).empty());

  auto v = ws.NewRunDirectory("1.2", "/tmp", {});
  REQUIRE(v.has_value());
  REQUIRE(v.value().compare(0, root.size() + 5, root + "/1.2/") == 0);
  RemoveTree(root);
}

TEST_CASE("TempWorkspace copies fixtures from the case directory", "[workspace]") {
  const std::string root = MakeTempDir();
  const std::string case_dir = MakeTempDir();
  Touch(case_dir + "/fixture.txt", "fixture");
  REQUIRE(itest::detail::MakeDirs(case_dir + "/repo/packaging"));
  Touch(case_dir + "/repo/packaging/fake.spec", "Name: fake");

  itest::TempWorkspace ws(root);
  auto dir = ws.NewRunDirectory("", case_dir, {"fixture.txt", "repo"});
  REQUIRE(dir.has_value());
  REQUIRE(itest::detail::IsRegularFile(dir.value() + "/fixture.txt"));
  REQUIRE(itest::detail::IsRegularFile(dir.value() + "/repo/packaging/fake.spec"));

  auto missing = ws.NewRunDirectory("", case_dir, {"nope"});
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.get_error() == itest::WorkspaceError::kFixtureMissing);

  RemoveTree(root);
  RemoveTree(case_dir);
}

TEST_CASE("TempWorkspace fails under an unusable root", "[workspace]") {
  itest::TempWorkspace ws("/proc/itest-cannot-create");
  auto dir = ws.NewRunDirectory("", "/tmp", {});
  REQUIRE_FALSE(dir.has_value());
  REQUIRE(dir.get_error() == itest::WorkspaceError::kCreateFailed);
}

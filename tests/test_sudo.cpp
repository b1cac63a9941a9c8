/**
 * @file test_sudo.cpp
 * @brief Tests for sudo.hpp - password prompt responder.
 */

#include "itest/sudo.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

static bool PromptMatches(const std::string& text) {
  std::regex re(itest::kSudoPromptPattern, std::regex::ECMAScript);
  return std::regex_search(text, re);
}

TEST_CASE("Sudo prompt pattern covers known distributions", "[sudo]") {
  REQUIRE(PromptMatches("[sudo] password for itestuser5707: "));
  REQUIRE(PromptMatches("root's password:"));
  REQUIRE(PromptMatches("itestuser23794's password:"));
  REQUIRE(PromptMatches("[sudo] password for itester:"));
  REQUIRE_FALSE(PromptMatches("Password:"));
  REQUIRE_FALSE(PromptMatches("enter passphrase:"));
}

TEST_CASE("SudoRules puts the password rule first", "[sudo]") {
  auto rules = itest::SudoRules("pw", {{"Continue\\?", "y"}, {"Overwrite\\?", "n"}});
  REQUIRE(rules.size() == 3U);
  REQUIRE(rules[0].pattern == itest::kSudoPromptPattern);
  REQUIRE(rules[0].response == "pw");
  REQUIRE(rules[1].response == "y");
  REQUIRE(rules[2].response == "n");

  auto only = itest::SudoRules("pw");
  REQUIRE(only.size() == 1U);
}

TEST_CASE("Sudo types the configured password", "[sudo]") {
  // A fake sudo on PATH that prompts like the real one
  char dir_tmpl[] = "/tmp/itest-sudo-XXXXXX";
  REQUIRE(mkdtemp(dir_tmpl) != nullptr);
  const std::string dir = dir_tmpl;
  const std::string fake = dir + "/sudo";
  FILE* f = std::fopen(fake.c_str(), "w");
  REQUIRE(f != nullptr);
  std::fprintf(f,
               "#!/bin/sh\n"
               "printf '[sudo] password for tester: '\n"
               "read pw\n"
               "[ \"$pw\" = secret ] || exit 3\n"
               "exec \"$@\"\n");
  std::fclose(f);
  REQUIRE(chmod(fake.c_str(), 0755) == 0);

  const char* old_path = std::getenv("PATH");
  const std::string saved = old_path != nullptr ? old_path : "";
  REQUIRE(setenv("PATH", (dir + ":" + saved).c_str(), 1) == 0);

  itest::Settings settings;
  settings.sudo_password = "secret";
  auto ok = itest::Sudo("true", settings);
  settings.sudo_password = "wrong";
  auto bad = itest::Sudo("true", settings);

  REQUIRE(setenv("PATH", saved.c_str(), 1) == 0);
  std::remove(fake.c_str());
  rmdir(dir.c_str());

  REQUIRE(ok.has_value());
  REQUIRE(ok.value() == 0);
  REQUIRE(bad.has_value());
  REQUIRE(bad.value() == 3);
}

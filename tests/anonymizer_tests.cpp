#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitactivity/anonymizer.hpp>

#include <optional>
#include <regex>
#include <string>

using namespace gitactivity;

static bool matches(const std::string& s, const char* re) {
  return std::regex_match(s, std::regex(re));
}

TEST_CASE("consistent_hash is sha256 truncated to hex") {
  // sha256("") = e3b0c442...
  REQUIRE(consistent_hash("") == "e3b0c442");
  REQUIRE(consistent_hash("", 16) == "e3b0c44298fc1c14");
  REQUIRE(consistent_hash("abc") == "ba7816bf");
  REQUIRE(consistent_hash("abc", 64).size() == 64);
}

TEST_CASE("anonymize_message keeps conventional prefixes") {
  auto a = anonymize_message(std::string("fix(auth): resolve login issue"));
  REQUIRE(matches(a, R"(^fix\(auth\): hash_[0-9a-f]{8}$)"));
  REQUIRE(a == "fix(auth): hash_" + consistent_hash("resolve login issue"));

  REQUIRE(anonymize_message(std::string("feat: add user authentication")) ==
          "feat: hash_" + consistent_hash("add user authentication"));

  // case and whitespace as written
  auto upper = anonymize_message(std::string("FEAT(ui-kit):   new button"));
  REQUIRE(upper == "FEAT(ui-kit):   hash_" + consistent_hash("new button"));

  auto no_space = anonymize_message(std::string("chore:bump deps"));
  REQUIRE(no_space == "chore:hash_" + consistent_hash("bump deps"));

  for (const char* t : {"feat", "fix", "docs", "style", "refactor", "perf",
                        "test", "chore", "build", "ci", "revert"}) {
    std::string msg = std::string(t) + ": something";
    REQUIRE(anonymize_message(msg) ==
            std::string(t) + ": hash_" + consistent_hash("something"));
  }
}

TEST_CASE("anonymize_message hashes whole text without a known prefix") {
  auto a = anonymize_message(std::string("some random commit message"));
  REQUIRE(matches(a, R"(^hash_[0-9a-f]{8}$)"));
  REQUIRE(a == "hash_" + consistent_hash("some random commit message"));

  REQUIRE(anonymize_message(std::string("feature: not a type")) ==
          "hash_" + consistent_hash("feature: not a type"));
  REQUIRE(anonymize_message(std::string("fix() empty scope")) ==
          "hash_" + consistent_hash("fix() empty scope"));
  REQUIRE(anonymize_message(std::string("fix(a b): spaced scope")) ==
          "hash_" + consistent_hash("fix(a b): spaced scope"));
  REQUIRE(anonymize_message(std::string("fix the login bug")) ==
          "hash_" + consistent_hash("fix the login bug"));
}

TEST_CASE("anonymize_message maps absent and empty to the same sentinel") {
  auto absent = anonymize_message(std::nullopt);
  auto empty = anonymize_message(std::string());
  REQUIRE(matches(absent, R"(^hash_[0-9a-f]{8}$)"));
  REQUIRE(absent == empty);
  REQUIRE(absent == "hash_" + consistent_hash("empty"));
}

TEST_CASE("anonymize_message is deterministic") {
  std::string msg = "refactor(core): split module";
  REQUIRE(anonymize_message(msg) == anonymize_message(msg));
  REQUIRE(anonymize_message(msg) != anonymize_message(std::string("refactor(core): merge module")));
}

TEST_CASE("anonymize_repository") {
  auto react = anonymize_repository(std::string("facebook/react"));
  auto vue = anonymize_repository(std::string("vuejs/vue"));
  REQUIRE(matches(react, R"(^repo_[0-9a-f]{8}$)"));
  REQUIRE(react != vue);
  REQUIRE(react == anonymize_repository(std::string("facebook/react")));
  REQUIRE(anonymize_repository(std::nullopt) == "repo_" + consistent_hash("unknown"));
}

TEST_CASE("anonymize_text depends on kind") {
  REQUIRE(anonymize_text(std::string("Fix bug"), TextKind::PullRequest) ==
          "pr_hash_" + consistent_hash("Fix bug"));
  REQUIRE(anonymize_text(std::string("LGTM"), TextKind::Review) ==
          "review_hash_" + consistent_hash("LGTM"));
  REQUIRE(anonymize_text(std::string("feat: x"), TextKind::Commit) ==
          anonymize_message(std::string("feat: x")));

  REQUIRE(anonymize_text(std::nullopt, TextKind::PullRequest) ==
          "pr_hash_" + consistent_hash("pr_empty"));
  REQUIRE(anonymize_text(std::nullopt, TextKind::Commit) ==
          "commit_hash_" + consistent_hash("commit_empty"));
  REQUIRE(anonymize_text(std::nullopt, TextKind::Review) ==
          "review_hash_" + consistent_hash("review_empty"));
}

TEST_CASE("split_conventional_prefix") {
  auto s = split_conventional_prefix("docs(readme): typo");
  REQUIRE(s.prefix == "docs(readme): ");
  REQUIRE(s.remainder == "typo");

  auto n = split_conventional_prefix("update readme");
  REQUIRE(n.prefix.empty());
  REQUIRE(n.remainder == "update readme");

  auto only = split_conventional_prefix("ci:");
  REQUIRE(only.prefix == "ci:");
  REQUIRE(only.remainder.empty());
}

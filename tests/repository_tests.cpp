#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "test_support.hpp"
#include <gitactivity/repository.hpp>
#include <gitactivity/timestamp.hpp>

using namespace gitactivity;
using namespace gitactivity_test;
namespace fs = std::filesystem;

static CommitRequest request(const std::string& msg, const char* when) {
  return CommitRequest{msg, "Test User", "test@example.com", *parse_timestamp(when)};
}

TEST_CASE("git is available, bogus binaries are not") {
  REQUIRE(RepositoryManager::is_tool_available());
  REQUIRE_FALSE(RepositoryManager::is_tool_available("/nonexistent/git"));
}

TEST_CASE("initialize_repository is idempotent") {
  auto base = mkd("repo_init");
  auto path = base / "nested" / "export";
  RepositoryManager repo(path);
  REQUIRE(repo.repository_path() == path);

  REQUIRE(repo.initialize_repository());
  REQUIRE(fs::exists(path / ".git"));
  auto cfg = run_command({"git", "config", "--local", "commit.gpgsign"}, path);
  REQUIRE(cfg.out == "false\n");

  REQUIRE_FALSE(repo.initialize_repository());
  REQUIRE_FALSE(RepositoryManager(path).initialize_repository());
}

TEST_CASE("a repository enclosing the target does not count") {
  auto outer = mkd("repo_outer");
  REQUIRE(run_command({"git", "init"}, outer).exit_code == 0);

  RepositoryManager repo(outer / "inner");
  REQUIRE(repo.initialize_repository());
  REQUIRE(fs::exists(outer / "inner" / ".git"));
}

TEST_CASE("commit_count is zero before the first commit") {
  auto dir = mkd("repo_count");
  RepositoryManager repo(dir / "r");
  REQUIRE(repo.commit_count() == 0); // no directory yet
  repo.initialize_repository();
  REQUIRE(repo.commit_count() == 0); // no HEAD yet
}

TEST_CASE("create_commit writes empty backdated commits") {
  auto dir = mkd("repo_commit");
  RepositoryManager repo(dir / "r");
  repo.initialize_repository();

  std::string err;
  REQUIRE(repo.create_commit(request("[commit]: first", "2026-01-01T10:00:00Z"), &err));
  REQUIRE(repo.create_commit(request("[pr]: second", "2026-01-02T12:00:00Z"), &err));
  REQUIRE(repo.commit_count() == 2);

  auto path = repo.repository_path();
  REQUIRE(git_subjects(path) == std::vector<std::string>{"[commit]: first", "[pr]: second"});
  REQUIRE(git_log_field(path, "%an <%ae>|%cn <%ce>") ==
          std::vector<std::string>{"Test User <test@example.com>|Test User <test@example.com>",
                                   "Test User <test@example.com>|Test User <test@example.com>"});
  REQUIRE(git_log_field(path, "%at|%ct") ==
          std::vector<std::string>{"1767261600|1767261600", "1767355200|1767355200"});

  auto tree = run_command({"git", "ls-tree", "-r", "HEAD"}, path);
  REQUIRE(tree.exit_code == 0);
  REQUIRE(tree.out.empty());
}

TEST_CASE("create_commit leaves the host environment untouched") {
  auto dir = mkd("repo_env");
  EnvGuard a("GIT_AUTHOR_DATE", nullptr);
  EnvGuard b("GIT_COMMITTER_DATE", "2001-01-01T00:00:00Z");
  EnvGuard c("GIT_COMMITTER_NAME", nullptr);
  EnvGuard d("GIT_COMMITTER_EMAIL", "someone@else.org");

  auto check = [] {
    REQUIRE_FALSE(get_env("GIT_AUTHOR_DATE").has_value());
    REQUIRE(get_env("GIT_COMMITTER_DATE") == std::optional<std::string>("2001-01-01T00:00:00Z"));
    REQUIRE_FALSE(get_env("GIT_COMMITTER_NAME").has_value());
    REQUIRE(get_env("GIT_COMMITTER_EMAIL") == std::optional<std::string>("someone@else.org"));
  };

  SECTION("on success") {
    RepositoryManager repo(dir / "ok");
    repo.initialize_repository();
    std::string err;
    REQUIRE(repo.create_commit(request("ok", "2026-03-01T00:00:00Z"), &err));
    check();
    // the overrides, not the host values, ended up in the commit
    REQUIRE(git_log_field(repo.repository_path(), "%ct|%ce") ==
            std::vector<std::string>{"1772323200|test@example.com"});
  }
  SECTION("on failure") {
    RepositoryManager repo(dir / "bad", failing_git(dir).string());
    repo.initialize_repository();
    std::string err;
    REQUIRE_FALSE(repo.create_commit(request("FAILME", "2026-03-01T00:00:00Z"), &err));
    REQUIRE(err.find("simulated failure") != std::string::npos);
    check();
    REQUIRE(repo.commit_count() == 0);
  }
}

TEST_CASE("create_commit outside a repository reports an error") {
  auto dir = mkd("repo_missing");
  RepositoryManager repo(dir);
  std::string err;
  // dir has no .git of its own but sits in the temp directory, so make sure
  // git does not walk up into an unrelated repository
  EnvGuard ceiling("GIT_CEILING_DIRECTORIES", dir.parent_path().c_str());
  REQUIRE_FALSE(repo.create_commit(request("x", "2026-01-01"), &err));
  REQUIRE_FALSE(err.empty());
}

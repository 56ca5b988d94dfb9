#pragma once
#include <gitactivity/contribution.hpp>
#include <gitactivity/process.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace gitactivity {

// Owns one on-disk git repository and appends backdated, empty commits to it.
class RepositoryManager {
public:
  explicit RepositoryManager(std::filesystem::path repository_path,
                             std::string git_binary = "git");

  // Creates the directory when missing and runs `git init` unless a .git entry
  // already sits directly at the target path. Returns true when the repository
  // was created by this call. Throws std::runtime_error on failure.
  bool initialize_repository();

  // Author and committer identity and dates are handed to the git child only.
  bool create_commit(const CommitRequest &req, std::string *err);

  // Number of commits reachable from HEAD, 0 when that cannot be determined.
  int commit_count() const;

  static bool is_tool_available(const std::string &git_binary = "git");

  const std::filesystem::path &repository_path() const { return root_; }

private:
  ExecResult run_git(const std::vector<std::string> &args,
                     EnvOverrides env = {}) const;

  std::filesystem::path root_;
  std::string git_;
};

} // namespace gitactivity

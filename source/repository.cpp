#include <gitactivity/repository.hpp>
#include <gitactivity/timestamp.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace gitactivity {

static std::string trim_output(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
    s.pop_back();
  return s;
}

static std::string failure_text(const ExecResult &r) {
  auto e = trim_output(r.err);
  if (e.empty())
    e = trim_output(r.out);
  return fmt::format("rc={}: {}", r.exit_code, e);
}

RepositoryManager::RepositoryManager(fs::path repository_path,
                                     std::string git_binary)
    : root_(std::move(repository_path)), git_(std::move(git_binary)) {}

ExecResult RepositoryManager::run_git(const std::vector<std::string> &args,
                                      EnvOverrides env) const {
  // Only the target directory decides which repository is used.
  env.emplace("GIT_DIR", std::nullopt);
  env.emplace("GIT_WORK_TREE", std::nullopt);
  env.emplace("GIT_INDEX_FILE", std::nullopt);

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(git_);
  argv.insert(argv.end(), args.begin(), args.end());
  spdlog::debug("[git] {} (in {})", fmt::join(argv, " "), root_.string());
  return run_command(argv, root_, env);
}

bool RepositoryManager::initialize_repository() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec)
    throw std::runtime_error(fmt::format("cannot create {}: {}",
                                         root_.string(), ec.message()));

  // An enclosing repository must not count, so `git rev-parse` is not asked.
  if (fs::exists(root_ / ".git", ec)) {
    spdlog::debug("[git] reusing repository at {}", root_.string());
    return false;
  }

  auto r = run_git({"init"});
  if (r.exit_code != 0)
    throw std::runtime_error(
        fmt::format("git init failed in {}: {}", root_.string(), failure_text(r)));

  r = run_git({"config", "commit.gpgsign", "false"});
  if (r.exit_code != 0)
    throw std::runtime_error(fmt::format("git config commit.gpgsign failed: {}",
                                         failure_text(r)));

  spdlog::info("[git] initialized repository at {}", root_.string());
  return true;
}

bool RepositoryManager::create_commit(const CommitRequest &req,
                                      std::string *err) {
  const auto date = format_git_date(req.date);
  EnvOverrides env{
      {"GIT_AUTHOR_DATE", date},
      {"GIT_COMMITTER_DATE", date},
      {"GIT_COMMITTER_NAME", req.author_name},
      {"GIT_COMMITTER_EMAIL", req.author_email},
  };
  const auto author = fmt::format("{} <{}>", req.author_name, req.author_email);

  auto r = run_git({"commit", "--allow-empty", "--no-verify", "--message",
                    req.message, "--author", author},
                   std::move(env));
  if (r.exit_code != 0) {
    if (err)
      *err = failure_text(r);
    return false;
  }
  return true;
}

int RepositoryManager::commit_count() const {
  auto r = run_git({"rev-list", "--count", "HEAD"});
  if (r.exit_code != 0)
    return 0;
  try {
    return std::stoi(trim_output(r.out));
  } catch (const std::exception &e) {
    spdlog::debug("[git] unexpected rev-list output '{}': {}", r.out, e.what());
    return 0;
  }
}

bool RepositoryManager::is_tool_available(const std::string &git_binary) {
  auto r = run_command({git_binary, "--version"}, {});
  if (r.exit_code != 0) {
    spdlog::debug("[git] '{} --version' failed: {}", git_binary,
                  failure_text(r));
    return false;
  }
  return true;
}

} // namespace gitactivity

#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gitactivity {

struct ExecResult {
  int exit_code{-1};
  std::string out;
  std::string err;
};

// Applied in the child only: a value sets the variable, nullopt removes it.
using EnvOverrides = std::map<std::string, std::optional<std::string>>;

ExecResult run_command(const std::vector<std::string> &argv,
                       const std::filesystem::path &cwd,
                       const EnvOverrides &env = {});

std::optional<std::string> get_env(const char *name);

} // namespace gitactivity

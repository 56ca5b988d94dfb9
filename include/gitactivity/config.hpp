#pragma once
#include <filesystem>
#include <string>

namespace gitactivity {

struct ExportConfig {
  std::filesystem::path work_dir; // empty: current directory at export time
  std::string output_dir = "git-contributions-export";
  std::string git_binary = "git";
  std::string default_author_name = "Git Activity Tracer";
  std::string default_author_email = "noreply@example.com";
  int progress_every = 100;

  static ExportConfig from_env();
};

struct Author {
  std::string name;
  std::string email;
};

// GIT_AUTHOR_NAME / GIT_AUTHOR_EMAIL with the configured fallbacks.
Author resolve_author(const ExportConfig &cfg);

// Applies GITACTIVITY_LOG_LEVEL to the default spdlog logger.
void configure_logging();

} // namespace gitactivity

#include <gitactivity/app.hpp>
#include <gitactivity/cli.hpp>
#include <gitactivity/config.hpp>
#include <gitactivity/formatter.hpp>
#include <gitactivity/loader.hpp>
#include <gitactivity/repository.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>
#include <type_traits>

#ifndef GITACTIVITY_VERSION
#define GITACTIVITY_VERSION "unknown"
#endif

namespace gitactivity {

static void print_help() {
  std::cout <<
      R"(gitactivity - export contribution records as reports or git history

Usage:
  gitactivity export --input <file> [--format console|json|csv|git]
                     [--anonymize] [--with-links]
                     [--output-dir <name>] [--work-dir <path>]
  gitactivity check
  gitactivity help | version

Environment:
  GIT_AUTHOR_NAME, GIT_AUTHOR_EMAIL   identity used for synthesized commits
  GITACTIVITY_GIT                     git executable (default: git)
  GITACTIVITY_PROGRESS_EVERY          progress message interval (default: 100)
  GITACTIVITY_LOG_LEVEL               trace|debug|info|warn|error|off
)";
}

static int run_export(const CmdExport &c) {
  ExportConfig cfg = ExportConfig::from_env();
  if (c.output_dir)
    cfg.output_dir = *c.output_dir;
  if (c.work_dir)
    cfg.work_dir = *c.work_dir;

  auto formatter = make_formatter(c.format, cfg);
  auto contributions = load_contributions(c.input);
  spdlog::info("[cli] {} contributions loaded from {}", contributions.size(),
               c.input);

  FormatOptions opts{c.anonymize, c.with_links};
  auto result = formatter->format(contributions, opts);
  std::cout << result.content << "\n";
  return 0;
}

int App::run(int argc, char **argv) {
  configure_logging();

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("[cli] {}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("gitactivity {}\n", GITACTIVITY_VERSION);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdCheck>) {
            auto cfg = ExportConfig::from_env();
            bool ok = RepositoryManager::is_tool_available(cfg.git_binary);
            std::cout << fmt::format("{}: {}\n", cfg.git_binary,
                                     ok ? "available" : "not available");
            return ok ? 0 : 1;

          } else {
            return run_export(c);
          }
        },
        *pr.cmd);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace gitactivity

#include <gitactivity/config.hpp>
#include <gitactivity/process.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace gitactivity {

ExportConfig ExportConfig::from_env() {
  ExportConfig cfg;
  if (auto git = get_env("GITACTIVITY_GIT"); git && !git->empty())
    cfg.git_binary = *git;
  if (auto every = get_env("GITACTIVITY_PROGRESS_EVERY")) {
    char *end = nullptr;
    long v = std::strtol(every->c_str(), &end, 10);
    if (end && *end == '\0' && v > 0)
      cfg.progress_every = static_cast<int>(v);
    else
      spdlog::warn("[config] ignoring GITACTIVITY_PROGRESS_EVERY='{}'", *every);
  }
  return cfg;
}

Author resolve_author(const ExportConfig &cfg) {
  Author a{cfg.default_author_name, cfg.default_author_email};
  if (auto n = get_env("GIT_AUTHOR_NAME"); n && !n->empty())
    a.name = *n;
  if (auto e = get_env("GIT_AUTHOR_EMAIL"); e && !e->empty())
    a.email = *e;
  return a;
}

void configure_logging() {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::info);
  auto lvl = get_env("GITACTIVITY_LOG_LEVEL");
  if (!lvl || lvl->empty())
    return;
  auto parsed = spdlog::level::from_str(*lvl);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && *lvl != "off") {
    spdlog::warn("[config] unknown GITACTIVITY_LOG_LEVEL '{}', using info", *lvl);
    return;
  }
  spdlog::set_level(parsed);
}

} // namespace gitactivity

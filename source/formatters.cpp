#include <gitactivity/anonymizer.hpp>
#include <gitactivity/config.hpp>
#include <gitactivity/formatter.hpp>
#include <gitactivity/synthesizer.hpp>
#include <gitactivity/timestamp.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace gitactivity {

std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '\"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        const char *hexd = "0123456789abcdef";
        o += "\\u00";
        o.push_back(hexd[(c >> 4) & 0xF]);
        o.push_back(hexd[c & 0xF]);
      } else {
        o.push_back(c);
      }
    }
  }
  return o;
}

std::string csv_field(const std::string &s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos)
    return s;
  std::string o = "\"";
  for (char c : s) {
    if (c == '"')
      o += "\"\"";
    else
      o.push_back(c);
  }
  o += "\"";
  return o;
}

// Repository and text as they appear in a structured report.
static std::string report_repository(const Contribution &c, bool anonymize) {
  return anonymize ? anonymize_repository(c.repository) : *c.repository;
}

static std::string report_text(const Contribution &c, bool anonymize) {
  if (!anonymize)
    return *c.text;
  if (auto kind = text_kind_from(c.type))
    return anonymize_text(c.text, *kind);
  return anonymize_message(c.text);
}

FormatResult ConsoleFormatter::format(const std::vector<Contribution> &contributions,
                                      const FormatOptions &options) {
  if (contributions.empty())
    return {"No contributions found in this range", {}};

  FormatResult result;
  std::vector<std::string> lines;
  std::string current_day;
  for (const auto &c : sort_by_timestamp(contributions)) {
    auto when = parse_timestamp(c.timestamp);
    std::string day = when ? format_utc_date(*when) : "unknown date";
    if (day != current_day) {
      lines.push_back(fmt::format("\n## {}", day));
      current_day = day;
    }
    if (!when) {
      auto w = fmt::format("unparseable timestamp '{}' for {}", c.timestamp, c.type);
      spdlog::warn("[export] {}", w);
      result.warnings.push_back(std::move(w));
    }

    std::vector<std::string> parts{c.type, when ? format_utc_time(*when) : c.timestamp};
    if (present(c.repository))
      parts.push_back(fmt::format(
          "[{}]", options.anonymize ? anonymize_repository(c.repository)
                                    : *c.repository));
    if (present(c.project_id))
      parts.push_back(fmt::format("{{{}}}", *c.project_id));
    if (present(c.target))
      parts.push_back(fmt::format("({})", *c.target));
    if (present(c.text))
      parts.push_back(options.anonymize ? anonymize_message(c.text) : *c.text);
    if (options.with_links && present(c.url))
      parts.push_back(fmt::format("({})", *c.url));
    lines.push_back(fmt::format("{}", fmt::join(parts, ": ")));
  }
  result.content = fmt::format("{}", fmt::join(lines, "\n"));
  return result;
}

FormatResult JsonFormatter::format(const std::vector<Contribution> &contributions,
                                   const FormatOptions &options) {
  if (contributions.empty())
    return {"[]", {}};

  std::vector<std::string> objects;
  for (const auto &c : sort_by_timestamp(contributions)) {
    std::vector<std::string> fields;
    auto add = [&](const char *key, const std::string &value) {
      fields.push_back(fmt::format("    \"{}\": \"{}\"", key, json_escape(value)));
    };
    add("type", c.type);
    add("timestamp", c.timestamp);
    if (present(c.repository))
      add("repository", report_repository(c, options.anonymize));
    if (present(c.project_id))
      add("projectId", *c.project_id);
    if (present(c.target))
      add("target", *c.target);
    if (present(c.text))
      add("text", report_text(c, options.anonymize));
    if (options.with_links && present(c.url))
      add("url", *c.url);
    objects.push_back(fmt::format("  {{\n{}\n  }}", fmt::join(fields, ",\n")));
  }
  return {fmt::format("[\n{}\n]", fmt::join(objects, ",\n")), {}};
}

FormatResult CsvFormatter::format(const std::vector<Contribution> &contributions,
                                  const FormatOptions &options) {
  std::vector<std::string> rows;
  rows.push_back(options.with_links
                     ? "timestamp,type,repository,project_id,target,text,url"
                     : "timestamp,type,repository,project_id,target,text");

  for (const auto &c : sort_by_timestamp(contributions)) {
    std::vector<std::string> cols;
    cols.push_back(csv_field(c.timestamp));
    cols.push_back(csv_field(c.type));
    cols.push_back(present(c.repository)
                       ? csv_field(report_repository(c, options.anonymize))
                       : "");
    cols.push_back(present(c.project_id) ? csv_field(*c.project_id) : "");
    cols.push_back(present(c.target) ? csv_field(*c.target) : "");
    cols.push_back(present(c.text) ? csv_field(report_text(c, options.anonymize))
                                   : "");
    if (options.with_links)
      cols.push_back(present(c.url) ? csv_field(*c.url) : "");
    rows.push_back(fmt::format("{}", fmt::join(cols, ",")));
  }
  return {fmt::format("{}\n", fmt::join(rows, "\n")), {}};
}

std::unique_ptr<Formatter> make_formatter(const std::string &name,
                                          const ExportConfig &cfg) {
  if (name == "console")
    return std::make_unique<ConsoleFormatter>();
  if (name == "json")
    return std::make_unique<JsonFormatter>();
  if (name == "csv")
    return std::make_unique<CsvFormatter>();
  if (name == "git")
    return std::make_unique<CommitSynthesizer>(cfg);
  throw std::runtime_error(fmt::format(
      "unknown format '{}' (expected console, json, csv or git)", name));
}

} // namespace gitactivity

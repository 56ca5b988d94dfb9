#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace gitactivity {

// One record of developer activity as delivered by a contribution source.
struct Contribution {
  std::string type;      // commit, pr, review, ...
  std::string timestamp; // ISO-8601 text, parsed on use
  std::optional<std::string> repository;
  std::optional<std::string> project_id;
  std::optional<std::string> target;
  std::optional<std::string> text;
  std::optional<std::string> url;
};

struct FormatOptions {
  bool anonymize = false;
  bool with_links = false;
};

struct FormatResult {
  std::string content;
  std::vector<std::string> warnings;
};

struct CommitRequest {
  std::string message;
  std::string author_name;
  std::string author_email;
  std::chrono::system_clock::time_point date;
};

// Optional fields count as present only when they hold non-empty text.
inline bool present(const std::optional<std::string> &v) {
  return v.has_value() && !v->empty();
}

// Stable ascending order by parsed timestamp; unparseable ones go last.
std::vector<Contribution> sort_by_timestamp(const std::vector<Contribution> &in);

} // namespace gitactivity

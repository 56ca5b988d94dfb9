#include <gitactivity/loader.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace gitactivity {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' ||
                        s.back() == '\n'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

static std::string unescape(const std::string &v) {
  std::string o;
  o.reserve(v.size());
  for (size_t i = 0; i < v.size(); ++i) {
    if (v[i] == '\\' && i + 1 < v.size()) {
      char n = v[i + 1];
      if (n == 'n') { o.push_back('\n'); ++i; continue; }
      if (n == '\\') { o.push_back('\\'); ++i; continue; }
    }
    o.push_back(v[i]);
  }
  return o;
}

namespace {

struct Section {
  Contribution c;
  int line = 0;
  bool has_type = false;
  bool has_timestamp = false;
};

} // namespace

static void finish(std::vector<Contribution> &out, std::optional<Section> &sec,
                   const std::string &origin) {
  if (!sec)
    return;
  if (!sec->has_type || !sec->has_timestamp)
    throw std::runtime_error(fmt::format(
        "{}:{}: [Contribution] needs Type= and Timestamp=", origin, sec->line));
  out.push_back(std::move(sec->c));
  sec.reset();
}

std::vector<Contribution> parse_contributions(std::istream &in,
                                              const std::string &origin) {
  std::vector<Contribution> out;
  std::optional<Section> sec;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';')
      continue;
    if (line.front() == '[' && line.back() == ']') {
      finish(out, sec, origin);
      if (line != "[Contribution]")
        throw std::runtime_error(
            fmt::format("{}:{}: unknown section {}", origin, lineno, line));
      sec = Section{};
      sec->line = lineno;
      continue;
    }
    if (!sec)
      throw std::runtime_error(fmt::format(
          "{}:{}: entry outside of a [Contribution] section", origin, lineno));

    auto eq = line.find('=');
    if (eq == std::string::npos)
      throw std::runtime_error(
          fmt::format("{}:{}: expected Key=Value", origin, lineno));
    auto key = trim(line.substr(0, eq));
    auto val = unescape(trim(line.substr(eq + 1)));

    auto &c = sec->c;
    if (key == "Type") {
      c.type = val;
      sec->has_type = !val.empty();
    } else if (key == "Timestamp") {
      c.timestamp = val;
      sec->has_timestamp = !val.empty();
    } else if (key == "Repository") {
      c.repository = val;
    } else if (key == "ProjectId") {
      c.project_id = val;
    } else if (key == "Target") {
      c.target = val;
    } else if (key == "Text") {
      c.text = val;
    } else if (key == "Url") {
      c.url = val;
    } else {
      throw std::runtime_error(
          fmt::format("{}:{}: unknown key '{}'", origin, lineno, key));
    }
  }
  finish(out, sec, origin);
  spdlog::debug("[load] {} contributions from {}", out.size(), origin);
  return out;
}

std::vector<Contribution> load_contributions(const std::filesystem::path &p) {
  std::ifstream in(p);
  if (!in)
    throw std::runtime_error("Contributions file not found: " + p.string());
  return parse_contributions(in, p.string());
}

} // namespace gitactivity

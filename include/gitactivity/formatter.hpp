#pragma once
#include <gitactivity/contribution.hpp>

#include <memory>
#include <string>
#include <vector>

namespace gitactivity {

class Formatter {
public:
  virtual ~Formatter() = default;
  virtual FormatResult format(const std::vector<Contribution> &contributions,
                              const FormatOptions &options) = 0;
};

class ConsoleFormatter : public Formatter {
public:
  FormatResult format(const std::vector<Contribution> &contributions,
                      const FormatOptions &options) override;
};

class JsonFormatter : public Formatter {
public:
  FormatResult format(const std::vector<Contribution> &contributions,
                      const FormatOptions &options) override;
};

class CsvFormatter : public Formatter {
public:
  FormatResult format(const std::vector<Contribution> &contributions,
                      const FormatOptions &options) override;
};

struct ExportConfig;

// "console", "json", "csv" or "git". Throws std::runtime_error otherwise.
std::unique_ptr<Formatter> make_formatter(const std::string &name,
                                          const ExportConfig &cfg);

std::string json_escape(const std::string &s);
std::string csv_field(const std::string &s);

} // namespace gitactivity

#pragma once
#include <gitactivity/config.hpp>
#include <gitactivity/contribution.hpp>
#include <gitactivity/formatter.hpp>

#include <string>
#include <vector>

namespace gitactivity {

class RepositoryManager;

struct SkippedContribution {
  std::string type;
  std::string timestamp;
  std::string reason;
};

struct BatchOutcome {
  int succeeded{0};
  std::vector<SkippedContribution> skipped;
};

// Turns contributions into empty, backdated commits of a local git repository
// and reports what happened as a human readable summary.
class CommitSynthesizer : public Formatter {
public:
  explicit CommitSynthesizer(ExportConfig cfg = ExportConfig::from_env());

  FormatResult format(const std::vector<Contribution> &contributions,
                      const FormatOptions &options) override;

  // "[type]: repository: (target): {projectId}: text", absent parts dropped.
  static std::string build_commit_message(const Contribution &c, bool anonymize);

  std::filesystem::path repository_path() const;

private:
  BatchOutcome commit_all(RepositoryManager &repo,
                          const std::vector<Contribution> &sorted,
                          const Author &author, bool anonymize) const;

  ExportConfig cfg_;
};

} // namespace gitactivity

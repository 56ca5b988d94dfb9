#include <gitactivity/contribution.hpp>
#include <gitactivity/timestamp.hpp>

#include <algorithm>
#include <utility>

namespace gitactivity {

std::vector<Contribution> sort_by_timestamp(const std::vector<Contribution> &in) {
  std::vector<std::pair<std::optional<TimePoint>, const Contribution *>> keyed;
  keyed.reserve(in.size());
  for (auto &c : in)
    keyed.emplace_back(parse_timestamp(c.timestamp), &c);

  std::stable_sort(keyed.begin(), keyed.end(), [](const auto &a, const auto &b) {
    if (!a.first)
      return false;
    if (!b.first)
      return true;
    return *a.first < *b.first;
  });

  std::vector<Contribution> out;
  out.reserve(in.size());
  for (auto &k : keyed)
    out.push_back(*k.second);
  return out;
}

} // namespace gitactivity

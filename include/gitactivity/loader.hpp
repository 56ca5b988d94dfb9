#pragma once
#include <gitactivity/contribution.hpp>

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace gitactivity {

// Reads [Contribution] sections. Throws std::runtime_error on malformed input.
std::vector<Contribution> load_contributions(const std::filesystem::path &p);
std::vector<Contribution> parse_contributions(std::istream &in,
                                              const std::string &origin);

} // namespace gitactivity

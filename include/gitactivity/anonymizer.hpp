#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace gitactivity {

enum class TextKind { Commit, PullRequest, Review };

const char *to_string(TextKind kind);
std::optional<TextKind> text_kind_from(std::string_view type);

// First `length` hex chars of SHA-256(input).
std::string consistent_hash(std::string_view input, std::size_t length = 8);

struct PrefixSplit {
  std::string prefix; // empty when no conventional-commit prefix matched
  std::string remainder;
};

// Splits "type(scope): " off the front of a message. The type has to be one of
// the conventional commit keywords (case-insensitive); the scope is optional.
PrefixSplit split_conventional_prefix(std::string_view message);

std::string anonymize_message(const std::optional<std::string> &message);
std::string anonymize_repository(const std::optional<std::string> &repository);
std::string anonymize_text(const std::optional<std::string> &text, TextKind kind);

} // namespace gitactivity

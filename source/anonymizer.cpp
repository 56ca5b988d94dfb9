#include <gitactivity/anonymizer.hpp>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <stdexcept>

namespace gitactivity {

namespace {

// Conventional commit types recognised in front of a message.
constexpr std::array<std::string_view, 11> kCommitTypes = {
    "feat", "fix",   "docs", "style", "refactor", "perf",
    "test", "chore", "build", "ci",   "revert"};

bool is_word(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

bool is_commit_type(std::string_view word) {
  for (auto t : kCommitTypes) {
    if (t.size() != word.size())
      continue;
    bool same = true;
    for (size_t i = 0; i < t.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(word[i])) != t[i]) {
        same = false;
        break;
      }
    }
    if (same)
      return true;
  }
  return false;
}

} // namespace

const char *to_string(TextKind kind) {
  switch (kind) {
  case TextKind::Commit:
    return "commit";
  case TextKind::PullRequest:
    return "pr";
  case TextKind::Review:
    return "review";
  }
  return "commit";
}

std::optional<TextKind> text_kind_from(std::string_view type) {
  if (type == "commit")
    return TextKind::Commit;
  if (type == "pr")
    return TextKind::PullRequest;
  if (type == "review")
    return TextKind::Review;
  return std::nullopt;
}

std::string consistent_hash(std::string_view input, std::size_t length) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int md_len = 0;
  if (EVP_Digest(input.data(), input.size(), md.data(), &md_len, EVP_sha256(),
                 nullptr) != 1)
    throw std::runtime_error("sha256 digest failed");

  static const char *hexd = "0123456789abcdef";
  std::string hex;
  hex.reserve(md_len * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    hex.push_back(hexd[(md[i] >> 4) & 0xF]);
    hex.push_back(hexd[md[i] & 0xF]);
  }
  return hex.substr(0, length);
}

PrefixSplit split_conventional_prefix(std::string_view message) {
  size_t i = 0;
  while (i < message.size() &&
         std::isalpha(static_cast<unsigned char>(message[i])))
    ++i;
  if (i == 0 || !is_commit_type(message.substr(0, i)))
    return {"", std::string(message)};

  if (i < message.size() && message[i] == '(') {
    size_t j = i + 1;
    while (j < message.size() && (is_word(message[j]) || message[j] == '-'))
      ++j;
    if (j == i + 1 || j >= message.size() || message[j] != ')')
      return {"", std::string(message)};
    i = j + 1;
  }

  if (i >= message.size() || message[i] != ':')
    return {"", std::string(message)};
  ++i;
  while (i < message.size() && is_space(message[i]))
    ++i;

  return {std::string(message.substr(0, i)), std::string(message.substr(i))};
}

std::string anonymize_message(const std::optional<std::string> &message) {
  if (!message || message->empty())
    return "hash_" + consistent_hash("empty");

  auto split = split_conventional_prefix(*message);
  if (split.prefix.empty())
    return "hash_" + consistent_hash(*message);
  return split.prefix + "hash_" + consistent_hash(split.remainder);
}

std::string anonymize_repository(const std::optional<std::string> &repository) {
  if (!repository || repository->empty())
    return "repo_" + consistent_hash("unknown");
  return "repo_" + consistent_hash(*repository);
}

std::string anonymize_text(const std::optional<std::string> &text,
                           TextKind kind) {
  const std::string k = to_string(kind);
  if (!text || text->empty())
    return k + "_hash_" + consistent_hash(k + "_empty");
  if (kind == TextKind::Commit)
    return anonymize_message(text);
  return k + "_hash_" + consistent_hash(*text);
}

} // namespace gitactivity

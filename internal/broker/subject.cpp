#include "subject.hpp"

#include <vector>

namespace rfshared::broker {

namespace {

std::vector<std::string_view> Tokens(std::string_view subject) {
  std::vector<std::string_view> tokens;
  size_t                        start = 0;
  while (true) {
    const auto dot = subject.find('.', start);
    if (dot == std::string_view::npos) {
      tokens.push_back(subject.substr(start));
      break;
    }
    tokens.push_back(subject.substr(start, dot - start));
    start = dot + 1;
  }
  return tokens;
}

} // namespace

bool IsValidSubject(std::string_view subject, bool allow_wildcards) {
  if (subject.empty()) return false;

  const auto tokens = Tokens(subject);
  for (size_t i = 0; i < tokens.size(); ++i) {
    const auto token = tokens[i];
    if (token.empty()) return false;

    for (char c : token) {
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') return false;
    }

    const bool is_wildcard = token == "*" || token == ">";
    if (!is_wildcard && (token.find('*') != std::string_view::npos || token.find('>') != std::string_view::npos)) return false;
    if (is_wildcard && !allow_wildcards) return false;
    if (token == ">" && i + 1 != tokens.size()) return false;
  }
  return true;
}

bool SubjectMatches(std::string_view pattern, std::string_view subject) {
  const auto p = Tokens(pattern);
  const auto s = Tokens(subject);

  for (size_t i = 0; i < p.size(); ++i) {
    if (p[i] == ">") return s.size() > i;
    if (i >= s.size()) return false;
    if (p[i] != "*" && p[i] != s[i]) return false;
  }
  return p.size() == s.size();
}

} // namespace rfshared::broker

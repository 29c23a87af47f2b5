#pragma once

#include <string_view>

namespace rfshared::broker {

/*
  Subjects are dot-separated, non-empty tokens ("rf.metadata.edge01").
  Patterns may use "*" for exactly one token and a trailing ">" for one or
  more remaining tokens.
*/

bool IsValidSubject(std::string_view subject, bool allow_wildcards);

bool SubjectMatches(std::string_view pattern, std::string_view subject);

} // namespace rfshared::broker

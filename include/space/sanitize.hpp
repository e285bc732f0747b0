#pragma once
#include <string>

namespace space {

// Refuses (PolicyErrorKind::EmptyAfterSanitization) any argument carrying
// shell metacharacters or control characters. Safe arguments are returned
// unchanged; nothing is escaped.
std::string sanitize_shell_arg(const std::string &arg);

bool is_shell_metachar(char c);

} // namespace space

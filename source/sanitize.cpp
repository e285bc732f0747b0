#include <space/errors.hpp>
#include <space/sanitize.hpp>
#include <space/validation.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string_view>

namespace space {

static constexpr std::string_view kShellMetachars = ";&|`$(){}[]\\<>?*~";

bool is_shell_metachar(char c) {
  return kShellMetachars.find(c) != std::string_view::npos;
}

std::string sanitize_shell_arg(const std::string &arg) {
  auto bad = std::find_if(arg.begin(), arg.end(), is_shell_metachar);
  if (bad != arg.end())
    throw PolicyError(PolicyErrorKind::EmptyAfterSanitization, "argument",
                      std::string(1, *bad),
                      fmt::format("Shell argument becomes empty after "
                                  "sanitization: '{}' contains '{}'",
                                  arg, *bad));

  if (has_control_characters(arg))
    throw PolicyError(PolicyErrorKind::EmptyAfterSanitization, "argument", arg,
                      "Shell argument becomes empty after sanitization: "
                      "control characters are not allowed");
  return arg;
}

} // namespace space

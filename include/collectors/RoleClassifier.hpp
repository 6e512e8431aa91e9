#pragma once
#include <optional>
#include <span>
#include <string_view>
#include "model/Process.hpp"

namespace ideguard::collectors {

struct RoleMarker {
  std::string_view needle;   // substring searched in the program or script name
  ideguard::model::ProcessRole role;
};

// Views into a whitespace-separated command line
struct CommandParts {
  std::string_view program;  // basename of argv[0]
  std::string_view script;   // basename of the first non-flag argument
  std::string_view type;     // value of the first --type= flag
  bool has_type{false};
};

[[nodiscard]] CommandParts split_command(std::string_view command);

// Terminal-host and language-server markers, first match wins. They are
// matched against the program name, and against the script name of
// --type=utility children and node-like interpreters. Free arguments of the
// main process (workspace paths) are never inspected.
[[nodiscard]] std::span<const RoleMarker> role_markers();

// Service marker, then --type= value; an unlisted --type= is Unknown and
// no --type= flag at all is the application's main (browser) process.
[[nodiscard]] ideguard::model::ProcessRole classify_role(std::string_view command);

} // namespace ideguard::collectors

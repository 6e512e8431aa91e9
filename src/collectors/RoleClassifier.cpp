#include "collectors/RoleClassifier.hpp"

#include <array>

namespace ideguard::collectors {

using ideguard::model::ProcessRole;

// Terminal and language-server hosts run as --type=utility children or as
// node scripts, so their markers are checked before the --type= flag.
static constexpr std::array<RoleMarker, 7> kServiceMarkers{{
  {"ptyHost",                    ProcessRole::TerminalHost},
  {"ptyhost",                    ProcessRole::TerminalHost},
  {"tsserver",                   ProcessRole::LanguageServer},
  {"typescript-language-server", ProcessRole::LanguageServer},
  {"languageserver",             ProcessRole::LanguageServer},
  {"language-server",            ProcessRole::LanguageServer},
  {"-lsp",                       ProcessRole::LanguageServer},
}};

static constexpr std::array<RoleMarker, 3> kTypeRoles{{
  {"renderer",    ProcessRole::Renderer},
  {"gpu-process", ProcessRole::Gpu},
  {"utility",     ProcessRole::Utility},
}};

// Hosts that run a script given as their first non-flag argument
static constexpr std::array<std::string_view, 5> kInterpreters{"node", "nodejs", "bun", "deno", "electron"};

std::span<const RoleMarker> role_markers() { return kServiceMarkers; }

static std::string_view basename_of(std::string_view path) {
  auto slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

static std::string_view next_token(std::string_view& rest) {
  size_t b = rest.find_first_not_of(" \t");
  if (b == std::string_view::npos) { rest = {}; return {}; }
  size_t e = rest.find_first_of(" \t", b);
  std::string_view tok = rest.substr(b, e == std::string_view::npos ? std::string_view::npos : e - b);
  rest = e == std::string_view::npos ? std::string_view{} : rest.substr(e);
  return tok;
}

static std::optional<ProcessRole> service_role(std::string_view name) {
  for (const auto& m : kServiceMarkers) {
    if (name.find(m.needle) != std::string_view::npos) return m.role;
  }
  return std::nullopt;
}

CommandParts split_command(std::string_view command) {
  CommandParts parts;
  std::string_view rest = command;
  parts.program = basename_of(next_token(rest));
  for (auto tok = next_token(rest); !tok.empty(); tok = next_token(rest)) {
    if (tok.starts_with("--type=")) {
      if (!parts.has_type) { parts.has_type = true; parts.type = tok.substr(7); }
    } else if (!tok.starts_with("-") && parts.script.empty()) {
      parts.script = basename_of(tok);
    }
  }
  return parts;
}

ProcessRole classify_role(std::string_view command) {
  const CommandParts parts = split_command(command);
  if (auto r = service_role(parts.program)) return *r;

  // The main process takes user paths as arguments; only utility children
  // and interpreters carry a service script there.
  bool script_host = parts.has_type && parts.type == "utility";
  for (auto interp : kInterpreters) {
    if (parts.program == interp) script_host = true;
  }
  if (script_host && !parts.script.empty()) {
    if (auto r = service_role(parts.script)) return *r;
  }

  if (!parts.has_type) return ProcessRole::Main;
  for (const auto& t : kTypeRoles) {
    if (parts.type == t.needle) return t.role;
  }
  return ProcessRole::Unknown;
}

} // namespace ideguard::collectors

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ideguard::model {

// Coarse classification of a process spawned by the multi-process target app
enum class ProcessRole {
  Main,
  Renderer,
  Utility,
  Gpu,
  LanguageServer,
  TerminalHost,
  Unknown
};

inline constexpr std::array<ProcessRole, 7> kAllRoles{
  ProcessRole::Main, ProcessRole::Renderer, ProcessRole::Utility, ProcessRole::Gpu,
  ProcessRole::LanguageServer, ProcessRole::TerminalHost, ProcessRole::Unknown};

[[nodiscard]] constexpr std::string_view role_name(ProcessRole r) {
  switch (r) {
    case ProcessRole::Main:           return "main";
    case ProcessRole::Renderer:       return "renderer";
    case ProcessRole::Utility:        return "utility";
    case ProcessRole::Gpu:            return "gpu";
    case ProcessRole::LanguageServer: return "language_server";
    case ProcessRole::TerminalHost:   return "terminal_host";
    case ProcessRole::Unknown:        return "unknown";
  }
  return "unknown";
}

// Inverse of role_name(); also accepts '-' for '_' ("terminal-host")
[[nodiscard]] inline std::optional<ProcessRole> parse_role(std::string_view name) {
  std::string norm(name);
  for (auto& c : norm) {
    if (c == '-') c = '_';
    else if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  for (auto r : kAllRoles) {
    if (role_name(r) == norm) return r;
  }
  return std::nullopt;
}

struct ProcessSample {
  int32_t pid{};
  std::string command;        // full cmdline, NUL separators replaced by spaces
  double cpu_percent{};       // ps scale: 100 = one full core
  double memory_percent{};    // rss / MemTotal, 0..100
  ProcessRole role{ProcessRole::Unknown};
  uint64_t total_ticks{};     // utime+stime (clock ticks)
  uint64_t rss_kb{};
};

struct ProcessTable {
  std::vector<ProcessSample> processes;
  size_t scanned{};           // /proc entries looked at this tick
  size_t vanished{};          // pids that disappeared between listing and reading
};

} // namespace ideguard::model

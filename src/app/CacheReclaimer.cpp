#include "app/CacheReclaimer.hpp"
#include "app/ActionLog.hpp"
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;

namespace ideguard::app {

std::optional<ReclaimProfile> parse_reclaim_profile(std::string_view s) {
  if (s == "safe") return ReclaimProfile::Safe;
  if (s == "full") return ReclaimProfile::Full;
  return std::nullopt;
}

std::vector<fs::path> reclaim_paths(ReclaimProfile p, const fs::path& app_config_dir, const fs::path& home) {
  std::vector<fs::path> out;
  if (!home.empty()) out.push_back(home / ".cache" / "fontconfig");
  if (app_config_dir.empty()) return out;
  for (const char* d : {"Cache", "CachedData", "Code Cache", "GPUCache"}) out.push_back(app_config_dir / d);
  if (p == ReclaimProfile::Full) {
    out.push_back(app_config_dir / "Service Worker");
    out.push_back(app_config_dir / "logs");
    out.push_back(app_config_dir / "User" / "globalStorage" / "ms-vscode.vscode-typescript-next");
  }
  return out;
}

void CacheReclaimer::report(std::string_view level, const std::string& message) {
  if (log_) {
    log_->note(level, message);
  } else if (level != "info") {
    std::fprintf(stderr, "ideguard: reclaim: %s\n", message.c_str());
  }
}

size_t CacheReclaimer::reclaim(const std::vector<fs::path>& paths) {
  size_t cleared = 0;
  for (const auto& p : paths) {
    if (p.empty()) continue;
    std::error_code ec;
    // symlink_status: a dangling link is still something to remove
    auto st = fs::symlink_status(p, ec);
    if (ec || !fs::exists(st)) {
      if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        ++failures_;
        report("warn", "cannot stat " + p.string() + ": " + ec.message());
      }
      continue;
    }
    auto n = fs::remove_all(p, ec);
    if (ec || n == static_cast<uintmax_t>(-1)) {
      ++failures_;
      report("warn", "failed to remove " + p.string() + ": " + ec.message());
      continue;
    }
    ++cleared;
    entries_removed_ += n;
    report("info", "removed " + p.string() + " (" + std::to_string(n) + " entries)");
  }
  return cleared;
}

} // namespace ideguard::app

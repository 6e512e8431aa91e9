#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include "model/Action.hpp"

namespace ideguard::app {

// Append-only text log of watchdog decisions and other destructive actions.
// Each line is optionally echoed to stdout. Not thread-safe: the watchdog
// loop is the only writer.
class ActionLog {
public:
  // An empty path disables the file sink (console only).
  explicit ActionLog(std::filesystem::path path, bool echo = true);
  ~ActionLog();
  ActionLog(const ActionLog&) = delete;
  ActionLog& operator=(const ActionLog&) = delete;

  void append(const ideguard::model::ActionLogEntry& e);
  // Free-form line: level is "info", "warn" or "error"
  void note(std::string_view level, std::string_view message);

  [[nodiscard]] bool file_ok() const { return file_.is_open() && file_.good(); }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // "pid=... role=... cpu=... mem=... action=... cmd=\"...\"" without the timestamp
  [[nodiscard]] static std::string format_entry(const ideguard::model::ActionLogEntry& e);
  [[nodiscard]] static std::string format_timestamp(std::chrono::system_clock::time_point t);

private:
  void write_line(std::chrono::system_clock::time_point t, std::string_view body, bool to_stderr);

  std::filesystem::path path_;
  bool echo_;
  std::ofstream file_;
};

} // namespace ideguard::app

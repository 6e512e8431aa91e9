#include "app/ActionLog.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace ideguard::app {

// Command lines of Electron children run to several KB; keep log lines readable
static constexpr size_t kMaxCmdChars = 160;

ActionLog::ActionLog(std::filesystem::path path, bool echo)
    : path_(std::move(path)), echo_(echo) {
  if (path_.empty()) return;
  std::error_code ec;
  if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    std::fprintf(stderr, "ideguard: ActionLog: failed to create %s: %s\n",
                 path_.parent_path().c_str(), ec.message().c_str());
  }
  file_.open(path_, std::ios::app);
  if (!file_) {
    std::fprintf(stderr, "ideguard: ActionLog: failed to open %s: %s (console only)\n",
                 path_.c_str(), std::strerror(errno));
  }
}

ActionLog::~ActionLog() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

std::string ActionLog::format_timestamp(std::chrono::system_clock::time_point t) {
  auto tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  ::localtime_r(&tt, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

static void append_quoted(std::string& out, std::string_view sv) {
  out += '"';
  size_t n = 0;
  for (char c : sv) {
    if (n++ == kMaxCmdChars) { out += "..."; break; }
    if (c == '"' || c == '\\') out += '\\';
    if (c == '\n') { out += "\\n"; continue; }
    out += c;
  }
  out += '"';
}

std::string ActionLog::format_entry(const ideguard::model::ActionLogEntry& e) {
  char nums[96];
  std::snprintf(nums, sizeof(nums), "pid=%d role=%.*s cpu=%.1f mem=%.1f action=",
                e.pid, static_cast<int>(ideguard::model::role_name(e.role).size()),
                ideguard::model::role_name(e.role).data(), e.cpu_percent, e.memory_percent);
  std::string out(nums);
  out += ideguard::model::action_name(e.action);
  if (!e.command.empty()) { out += " cmd="; append_quoted(out, e.command); }
  if (!e.detail.empty()) { out += " detail="; append_quoted(out, e.detail); }
  return out;
}

void ActionLog::append(const ideguard::model::ActionLogEntry& e) {
  write_line(e.timestamp, format_entry(e), e.action == ideguard::model::ActionKind::KillFailed);
}

void ActionLog::note(std::string_view level, std::string_view message) {
  std::string body;
  body.reserve(level.size() + message.size() + 3);
  body += '[';
  body += level;
  body += "] ";
  body += message;
  write_line(std::chrono::system_clock::now(), body, level != "info");
}

void ActionLog::write_line(std::chrono::system_clock::time_point t, std::string_view body, bool to_stderr) {
  auto ts = format_timestamp(t);
  if (file_.is_open()) {
    file_ << ts << ' ' << body << '\n';
    file_.flush();
  }
  if (echo_ || to_stderr) {
    std::FILE* stream = to_stderr ? stderr : stdout;
    std::fprintf(stream, "[%s] %.*s\n", ts.c_str(), static_cast<int>(body.size()), body.data());
    std::fflush(stream);
  }
}

} // namespace ideguard::app

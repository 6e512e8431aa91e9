#include "minitest.hpp"
#include "app/Launcher.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("ideguard_test_launch_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

TEST(launch_profiles_compose_flags) {
  const auto* safe = ideguard::app::find_launch_profile("safe");
  const auto* crash = ideguard::app::find_launch_profile("crash-fix");
  const auto* low = ideguard::app::find_launch_profile("low-gpu");
  ASSERT_TRUE(safe && crash && low);
  ASSERT_TRUE(ideguard::app::find_launch_profile("turbo") == nullptr);
  ASSERT_TRUE(contains(safe->flags, "--disable-gpu"));
  ASSERT_TRUE(contains(safe->flags, "--js-flags=--max-old-space-size=1024"));
  ASSERT_TRUE(safe->env.empty());
  // crash-fix starts from the safe set
  for (const auto& f : safe->flags) ASSERT_TRUE(contains(crash->flags, f));
  ASSERT_TRUE(contains(crash->flags, "--disable-ipc-flooding-protection"));
  ASSERT_TRUE(contains(low->flags, "--js-flags=--max-old-space-size=512"));
  bool node_opts = std::any_of(low->env.begin(), low->env.end(), [](const auto& kv){
    return kv.first == "NODE_OPTIONS" && kv.second == "--max-old-space-size=512";
  });
  ASSERT_TRUE(node_opts);
}

TEST(launch_argv_order) {
  const auto* safe = ideguard::app::find_launch_profile("safe");
  auto argv = ideguard::app::build_argv("/opt/cursor", *safe, {"--new-window", "/src"});
  ASSERT_EQ(argv.front(), std::string("/opt/cursor"));
  ASSERT_EQ(argv.size(), 1 + safe->flags.size() + 2);
  ASSERT_EQ(argv[1], safe->flags[0]);
  ASSERT_EQ(argv[argv.size() - 2], std::string("--new-window"));
  ASSERT_EQ(argv.back(), std::string("/src"));
}

TEST(launch_env_overrides_base) {
  const auto* low = ideguard::app::find_launch_profile("low-gpu");
  auto env = ideguard::app::build_env(*low, {"HOME=/home/u", "NODE_OPTIONS=--inspect", "PATH=/bin"});
  ASSERT_TRUE(contains(env, "HOME=/home/u"));
  ASSERT_TRUE(contains(env, "PATH=/bin"));
  ASSERT_TRUE(contains(env, "NODE_OPTIONS=--max-old-space-size=512"));
  ASSERT_TRUE(!contains(env, "NODE_OPTIONS=--inspect"));
  ASSERT_TRUE(contains(env, "ELECTRON_DISABLE_GPU=1"));
}

TEST(resolve_prefers_configured_executable) {
  auto root = make_root("exe");
  auto exe = root / "my-cursor";
  std::ofstream(exe) << "#!/bin/sh\nexit 0\n";
  ::chmod(exe.c_str(), 0755);
  ideguard::model::TargetSpec t;
  t.executable = exe;
  t.binary_name = "definitely-not-on-path-ideguard";
  auto got = ideguard::app::resolve_executable(t);
  ASSERT_TRUE(got.has_value());
  ASSERT_TRUE(*got == exe);
  fs::remove_all(root);
}

TEST(resolve_finds_app_image_and_sets_exec_bit) {
  auto root = make_root("appimage");
  fs::create_directories(root / "Downloads");
  auto img = root / "Downloads" / "Cursor-1.2.3-x86_64.AppImage";
  std::ofstream(img) << "not really an appimage";
  ::chmod(img.c_str(), 0644);
  std::ofstream(root / "Downloads" / "Other.AppImage") << "x";

  ideguard::model::TargetSpec t;
  t.binary_name = "definitely-not-on-path-ideguard";
  t.search_dirs = {root / "Applications", root / "Downloads"};
  std::vector<std::string> searched;
  auto got = ideguard::app::resolve_executable(t, &searched);
  ASSERT_TRUE(got.has_value());
  ASSERT_TRUE(*got == img);
  ASSERT_TRUE(::access(img.c_str(), X_OK) == 0);
  ASSERT_TRUE(searched.size() >= 2u);
  fs::remove_all(root);
}

TEST(resolve_reports_not_found) {
  auto root = make_root("none");
  ideguard::model::TargetSpec t;
  t.binary_name = "definitely-not-on-path-ideguard";
  t.search_dirs = {root};
  std::vector<std::string> searched;
  ASSERT_TRUE(!ideguard::app::resolve_executable(t, &searched).has_value());
  ASSERT_EQ(searched.size(), 2u);
  fs::remove_all(root);
}

TEST(spawn_attached_returns_exit_status) {
  auto res = ideguard::app::spawn({"/bin/sh", "-c", "exit 7"}, ideguard::app::current_environment(),
                                  ideguard::app::LaunchMode::Attached);
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.exit_status, 7);
  ASSERT_TRUE(res.pid > 0);
}

TEST(spawn_passes_environment) {
  auto res = ideguard::app::spawn({"/bin/sh", "-c", "test \"$IDEGUARD_PROBE\" = yes"}, {"IDEGUARD_PROBE=yes"},
                                  ideguard::app::LaunchMode::Attached);
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.exit_status, 0);
}

TEST(spawn_reports_exec_failure) {
  auto res = ideguard::app::spawn({"/nonexistent/ideguard-binary"}, {}, ideguard::app::LaunchMode::Detached);
  ASSERT_TRUE(!res.ok);
  ASSERT_TRUE(res.error.find("/nonexistent/ideguard-binary") != std::string::npos);
}

TEST(spawn_detached_returns_without_waiting) {
  auto res = ideguard::app::spawn({"/bin/sleep", "0"}, {}, ideguard::app::LaunchMode::Detached);
  ASSERT_TRUE(res.ok);
  ASSERT_TRUE(res.pid > 0);
}

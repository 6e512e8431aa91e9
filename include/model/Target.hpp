#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace ideguard::model {

// Where the target application lives and how to recognise its processes
struct TargetSpec {
  std::string match{"cursor"};              // cmdline substring, case-insensitive
  std::filesystem::path executable{};       // explicit path wins when set
  std::string binary_name{"cursor"};        // looked up on PATH
  std::string app_image_prefix{"Cursor"};   // <prefix>*.AppImage
  std::vector<std::filesystem::path> search_dirs{};
  std::filesystem::path config_dir{};       // e.g. ~/.config/Cursor
};

} // namespace ideguard::model

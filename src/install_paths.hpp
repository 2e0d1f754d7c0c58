#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

// Where the game keeps its installation, mods and displaced mods. Computed
// once at startup and handed to the reconciler as a value.
struct InstallPaths {
  std::filesystem::path install_dir;
  std::filesystem::path mods_dir;    // install_dir / "mods"
  std::filesystem::path backup_dir;  // mods_dir / "backup"

  static InstallPaths from_install_dir(const std::filesystem::path& install_dir);
};

enum class Platform { Linux, MacOS, Windows, Unsupported };

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

Platform current_platform();
const char* platform_name(Platform platform);
std::optional<std::string> process_env(const std::string& name);

// Throws ConfigurationError when the platform is unsupported or the
// variable that locates the user's directories is unset.
InstallPaths resolve_install_paths(Platform platform, const EnvLookup& env);
InstallPaths resolve_install_paths();

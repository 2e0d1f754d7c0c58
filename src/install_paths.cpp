#include "install_paths.hpp"

#include <cstdlib>

#include <spdlog/fmt/fmt.h>

#include "sync_errors.hpp"

namespace {

std::filesystem::path require_env(const EnvLookup& env, const std::string& name) {
  std::optional<std::string> value;
  if(env) value = env(name);
  if(!value || value->empty()) {
    throw ConfigurationError(fmt::format("${} is not defined", name));
  }
  return std::filesystem::path(*value);
}

} // namespace

InstallPaths InstallPaths::from_install_dir(const std::filesystem::path& install_dir) {
  InstallPaths paths;
  paths.install_dir = install_dir;
  paths.mods_dir = install_dir / "mods";
  paths.backup_dir = paths.mods_dir / "backup";
  return paths;
}

Platform current_platform() {
#if defined(_WIN32)
  return Platform::Windows;
#elif defined(__APPLE__)
  return Platform::MacOS;
#elif defined(__linux__)
  return Platform::Linux;
#else
  return Platform::Unsupported;
#endif
}

const char* platform_name(Platform platform) {
  switch(platform) {
    case Platform::Linux: return "linux";
    case Platform::MacOS: return "darwin";
    case Platform::Windows: return "windows";
    case Platform::Unsupported: break;
  }
  return "unsupported";
}

std::optional<std::string> process_env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if(!value) return std::nullopt;
  return std::string(value);
}

InstallPaths resolve_install_paths(Platform platform, const EnvLookup& env) {
  switch(platform) {
    case Platform::Linux:
      return InstallPaths::from_install_dir(require_env(env, "HOME") / ".minecraft");
    case Platform::MacOS:
      return InstallPaths::from_install_dir(
        require_env(env, "HOME") / "Library" / "Application Support" / "minecraft");
    case Platform::Windows:
      return InstallPaths::from_install_dir(require_env(env, "APPDATA") / ".minecraft");
    case Platform::Unsupported:
      break;
  }
  throw ConfigurationError(fmt::format("\"{}\" is unsupported", platform_name(platform)));
}

InstallPaths resolve_install_paths() {
  return resolve_install_paths(current_platform(), process_env);
}

#pragma once

#include <memory>
#include <string>

#include "install_paths.hpp"
#include "log.hpp"
#include "reconciler.hpp"
#include "remote_source.hpp"

class SettingsManager;

// Turns settings into a sync run or a running mod server.
class SyncEngine {
public:
  explicit SyncEngine(std::shared_ptr<SettingsManager> settings,
                      std::shared_ptr<Logger> logger = nullptr);

  // install_dir setting when given, platform default otherwise. Throws
  // ConfigurationError.
  InstallPaths resolve_paths() const;

  // A directory path selects DirectorySource, anything else is parsed as
  // host:port. Throws std::invalid_argument when no source is set.
  std::unique_ptr<RemoteSource> make_source() const;

  SyncPolicy policy() const;

  SyncSummary run_sync();

  // Serves until SIGINT/SIGTERM.
  void run_server();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  std::string extension() const;

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
};

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "install_paths.hpp"
#include "log.hpp"
#include "remote_source.hpp"
#include "sync_observer.hpp"

// Creates dir and any missing parents. Throws DirectoryError.
void ensure_directory(const std::filesystem::path& dir);

// Closes an artifact when the scope ends. Close failures are logged, never
// thrown, so they cannot hide the error that unwound the scope.
class ArtifactReleaseGuard {
public:
  ArtifactReleaseGuard(RemoteArtifact& artifact, Logger* logger)
    : artifact_(artifact), logger_(logger) {}
  ~ArtifactReleaseGuard();

  ArtifactReleaseGuard(const ArtifactReleaseGuard&) = delete;
  ArtifactReleaseGuard& operator=(const ArtifactReleaseGuard&) = delete;

private:
  RemoteArtifact& artifact_;
  Logger* logger_;
};

// Owns the worker threads of every phase run on it. A phase that stops
// waiting after its first failure leaves its threads here; they are joined
// by the next join_all() or on destruction.
class TransferWorkers {
public:
  TransferWorkers() = default;
  ~TransferWorkers();

  TransferWorkers(const TransferWorkers&) = delete;
  TransferWorkers& operator=(const TransferWorkers&) = delete;

  void spawn(std::function<void()> fn);
  void join_all();

private:
  std::mutex mutex_;
  std::vector<std::thread> threads_;
};

class TransferExecutor {
public:
  using Task = std::function<void()>;

  TransferExecutor(InstallPaths paths,
                   std::shared_ptr<SyncObserver> observer,
                   std::shared_ptr<Logger> logger);

  const InstallPaths& paths() const { return paths_; }
  Logger* logger() const { return logger_.get(); }

  // Creates or truncates destination and streams the artifact into it.
  // The artifact is closed on the way out whatever happens. Throws
  // WriteFailed.
  void write_artifact(RemoteArtifact& artifact, const std::filesystem::path& destination) const;

  // Renames mods_dir/name to backup_dir/name, creating backup_dir if it is
  // missing. No copy fallback. Throws BackupFailed.
  void backup_artifact(const std::string& name) const;

  // Runs every task on a thread owned by workers and waits for one result
  // per task. The first failure is rethrown at once; tasks still running
  // keep going and their results are dropped. After a clean phase the
  // threads are joined before returning.
  void run_phase(TransferWorkers& workers, const std::string& phase, std::vector<Task> tasks) const;

  void notify(const SyncEvent& event) const;

private:
  InstallPaths paths_;
  std::shared_ptr<SyncObserver> observer_;
  std::shared_ptr<Logger> logger_;
};

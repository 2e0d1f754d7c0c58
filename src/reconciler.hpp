#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "install_paths.hpp"
#include "local_inventory.hpp"
#include "log.hpp"
#include "remote_source.hpp"
#include "sync_observer.hpp"

class TransferExecutor;
class TransferWorkers;

inline constexpr const char* kDefaultArtifactExtension = ".jar";

struct SyncPolicy {
  // Overwrite local mods that share a name with a server mod without
  // comparing sizes.
  bool force = false;
  // Leave local mods that are not on the server where they are. Combined
  // with force the local directory is not even scanned.
  bool keep_existing = false;
};

enum class Decision { WriteNew, ReplaceWithBackup, Overwrite, Skip, BackupOrphan };

const char* decision_name(Decision decision);

// Decision for one server mod. Equal byte length counts as equal content.
Decision decide(std::optional<uint64_t> local_size, uint64_t remote_size, const SyncPolicy& policy);

struct SyncSummary {
  std::size_t written = 0;     // new or forced
  std::size_t replaced = 0;    // old copy moved to backup first
  std::size_t skipped = 0;
  std::size_t orphans_backed_up = 0;
};

struct ReconcilerOptions {
  std::string artifact_extension = kDefaultArtifactExtension;
};

// Makes the mods directory match a server's mod set. Local mods that would
// be lost (replaced or absent from the server) are moved to the backup
// directory instead of being deleted.
class Reconciler {
public:
  Reconciler(InstallPaths paths,
             std::shared_ptr<SyncObserver> observer = nullptr,
             std::shared_ptr<Logger> logger = nullptr,
             ReconcilerOptions options = ReconcilerOptions());
  // Joins any transfer threads a failed run left behind.
  ~Reconciler();
  Reconciler(Reconciler&&) noexcept;
  Reconciler& operator=(Reconciler&&) noexcept;

  // Throws NoRemoteArtifacts, DirectoryError, WriteFailed, BackupFailed, or
  // whatever the source throws while listing. On failure the mods directory
  // may be partially synced; running again converges.
  SyncSummary sync(RemoteSource& source, const SyncPolicy& policy);
  SyncSummary sync(const RemoteArtifactList& artifacts, const SyncPolicy& policy);

  const InstallPaths& paths() const { return paths_; }

private:
  class Tally;

  void write_phase(const std::shared_ptr<TransferExecutor>& executor,
                   const RemoteArtifactList& artifacts,
                   const SyncPolicy& policy,
                   const std::shared_ptr<LocalInventory>& inventory,
                   const std::shared_ptr<Tally>& tally);
  void backup_phase(const std::shared_ptr<TransferExecutor>& executor,
                    const std::vector<std::string>& orphans,
                    const std::shared_ptr<Tally>& tally);

  InstallPaths paths_;
  std::shared_ptr<SyncObserver> observer_;
  std::shared_ptr<Logger> logger_;
  ReconcilerOptions options_;
  std::unique_ptr<TransferWorkers> workers_;
};

#include "reconciler.hpp"

#include <vector>

#include "sync_errors.hpp"
#include "transfer_executor.hpp"

namespace fs = std::filesystem;

namespace {

void release_all(const RemoteArtifactList& artifacts, Logger* logger) {
  for(const auto& artifact : artifacts) {
    if(artifact) {
      ArtifactReleaseGuard release(*artifact, logger);
    }
  }
}

} // namespace

// Counters bumped by transfer tasks.
class Reconciler::Tally {
public:
  void count(Decision decision) {
    std::lock_guard<std::mutex> lock(m_);
    switch(decision) {
      case Decision::WriteNew:
      case Decision::Overwrite: ++summary_.written; break;
      case Decision::ReplaceWithBackup: ++summary_.replaced; break;
      case Decision::Skip: ++summary_.skipped; break;
      case Decision::BackupOrphan: ++summary_.orphans_backed_up; break;
    }
  }

  SyncSummary summary() const {
    std::lock_guard<std::mutex> lock(m_);
    return summary_;
  }

private:
  mutable std::mutex m_;
  SyncSummary summary_;
};

const char* decision_name(Decision decision) {
  switch(decision) {
    case Decision::WriteNew: return "write";
    case Decision::ReplaceWithBackup: return "replace";
    case Decision::Overwrite: return "overwrite";
    case Decision::Skip: return "skip";
    case Decision::BackupOrphan: return "backup";
  }
  return "unknown";
}

Decision decide(std::optional<uint64_t> local_size, uint64_t remote_size, const SyncPolicy& policy) {
  if(policy.force) return Decision::Overwrite;
  if(!local_size) return Decision::WriteNew;
  if(*local_size != remote_size) return Decision::ReplaceWithBackup;
  return Decision::Skip;
}

Reconciler::Reconciler(InstallPaths paths,
                       std::shared_ptr<SyncObserver> observer,
                       std::shared_ptr<Logger> logger,
                       ReconcilerOptions options)
  : paths_(std::move(paths)),
    observer_(std::move(observer)),
    logger_(std::move(logger)),
    options_(std::move(options)),
    workers_(std::make_unique<TransferWorkers>()) {}

Reconciler::~Reconciler() = default;
Reconciler::Reconciler(Reconciler&&) noexcept = default;
Reconciler& Reconciler::operator=(Reconciler&&) noexcept = default;

SyncSummary Reconciler::sync(RemoteSource& source, const SyncPolicy& policy) {
  log_debug(logger_.get(), "listing mods from {}", source.describe());
  return sync(source.list_artifacts(), policy);
}

SyncSummary Reconciler::sync(const RemoteArtifactList& artifacts, const SyncPolicy& policy) {
  if(artifacts.empty()) {
    throw NoRemoteArtifacts();
  }

  auto executor = std::make_shared<TransferExecutor>(paths_, observer_, logger_);
  auto tally = std::make_shared<Tally>();
  std::shared_ptr<LocalInventory> inventory;
  try {
    ensure_directory(paths_.mods_dir);
    if(!(policy.force && policy.keep_existing)) {
      inventory = LocalInventory::scan(paths_.mods_dir, options_.artifact_extension);
      log_debug(logger_.get(), "{} local mods in \"{}\"", inventory->size(), paths_.mods_dir.string());
    }
  } catch(...) {
    release_all(artifacts, logger_.get());
    throw;
  }

  write_phase(executor, artifacts, policy, inventory, tally);

  if(!policy.keep_existing && inventory && !inventory->empty()) {
    auto orphans = inventory->names();
    ensure_directory(paths_.backup_dir);
    backup_phase(executor, orphans, tally);
  }

  auto summary = tally->summary();
  log_info(logger_.get(), "sync complete: {} written, {} replaced, {} unchanged, {} backed up",
           summary.written, summary.replaced, summary.skipped, summary.orphans_backed_up);
  return summary;
}

void Reconciler::write_phase(const std::shared_ptr<TransferExecutor>& executor,
                             const RemoteArtifactList& artifacts,
                             const SyncPolicy& policy,
                             const std::shared_ptr<LocalInventory>& inventory,
                             const std::shared_ptr<Tally>& tally) {
  std::vector<TransferExecutor::Task> tasks;
  tasks.reserve(artifacts.size());
  for(const auto& artifact : artifacts) {
    tasks.push_back([executor, artifact, policy, inventory, tally]() {
      ArtifactReleaseGuard release(*artifact, executor->logger());

      const std::string name = artifact->name();
      const fs::path destination = executor->paths().mods_dir / name;

      std::optional<uint64_t> local_size;
      if(inventory && !policy.force) {
        local_size = inventory->size_of(name);
      }
      const Decision decision = decide(local_size, artifact->size(), policy);
      log_debug(executor->logger(), "{} \"{}\" ({} bytes)", decision_name(decision), name, artifact->size());

      switch(decision) {
        case Decision::WriteNew:
        case Decision::Overwrite:
          executor->write_artifact(*artifact, destination);
          break;
        case Decision::ReplaceWithBackup:
          executor->backup_artifact(name);
          executor->write_artifact(*artifact, destination);
          break;
        case Decision::Skip:
        case Decision::BackupOrphan:
          break;
      }

      if(inventory && !policy.keep_existing) {
        inventory->claim(name);
      }
      tally->count(decision);
    });
  }
  executor->run_phase(*workers_, "write", std::move(tasks));
}

void Reconciler::backup_phase(const std::shared_ptr<TransferExecutor>& executor,
                              const std::vector<std::string>& orphans,
                              const std::shared_ptr<Tally>& tally) {
  log_debug(logger_.get(), "{} local mods are not on the server", orphans.size());
  std::vector<TransferExecutor::Task> tasks;
  tasks.reserve(orphans.size());
  for(const auto& name : orphans) {
    tasks.push_back([executor, name, tally]() {
      executor->backup_artifact(name);
      tally->count(Decision::BackupOrphan);
    });
  }
  executor->run_phase(*workers_, "backup", std::move(tasks));
}

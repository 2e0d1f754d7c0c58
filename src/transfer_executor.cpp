#include "transfer_executor.hpp"

#include <fstream>
#include <thread>

#include "result_channel.hpp"
#include "sync_errors.hpp"

namespace fs = std::filesystem;

void ensure_directory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if(ec) throw DirectoryError(dir, ec.message());
  if(!fs::is_directory(dir, ec)) {
    throw DirectoryError(dir, "not a directory");
  }
}

ArtifactReleaseGuard::~ArtifactReleaseGuard() {
  try {
    artifact_.close();
  } catch(const std::exception& e) {
    log_warn(logger_, "closing \"{}\" failed: {}", artifact_.name(), e.what());
  }
}

TransferExecutor::TransferExecutor(InstallPaths paths,
                                   std::shared_ptr<SyncObserver> observer,
                                   std::shared_ptr<Logger> logger)
  : paths_(std::move(paths)),
    observer_(observer ? std::move(observer) : std::make_shared<NullSyncObserver>()),
    logger_(std::move(logger)) {}

void TransferExecutor::notify(const SyncEvent& event) const {
  observer_->on_event(event);
}

void TransferExecutor::write_artifact(RemoteArtifact& artifact, const fs::path& destination) const {
  ArtifactReleaseGuard release(artifact, logger_.get());

  notify(SyncEvent::write_started(ArtifactInfo{artifact.name(), artifact.size()}, destination));
  log_info(logger_.get(), "writing \"{}\" ...", destination.string());

  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw WriteFailed(destination, "cannot create file");
  }

  uint64_t written = 0;
  try {
    written = artifact.write_to(out);
  } catch(const std::exception& e) {
    throw WriteFailed(destination, e.what());
  }

  out.flush();
  if(!out) {
    throw WriteFailed(destination, "stream error after " + std::to_string(written) + " bytes");
  }
  out.close();
  if(out.fail()) {
    throw WriteFailed(destination, "close failed");
  }
  log_debug(logger_.get(), "wrote {} bytes to \"{}\"", written, destination.string());
}

void TransferExecutor::backup_artifact(const std::string& name) const {
  const auto from = paths_.mods_dir / name;
  const auto to = paths_.backup_dir / name;

  notify(SyncEvent::backup_started(name, from, to));
  log_info(logger_.get(), "moving \"{}\" to \"{}\" ...", from.string(), paths_.backup_dir.string());

  std::error_code ec;
  fs::create_directories(paths_.backup_dir, ec);
  if(ec) throw BackupFailed(name, ec.message());

  fs::rename(from, to, ec);
  if(ec) throw BackupFailed(name, ec.message());
}

TransferWorkers::~TransferWorkers() {
  join_all();
}

void TransferWorkers::spawn(std::function<void()> fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  threads_.emplace_back(std::move(fn));
}

void TransferWorkers::join_all() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    threads.swap(threads_);
  }
  for(auto& t : threads) {
    if(t.joinable()) t.join();
  }
}

void TransferExecutor::run_phase(TransferWorkers& workers,
                                 const std::string& phase,
                                 std::vector<Task> tasks) const {
  const std::size_t total = tasks.size();
  if(total == 0) return;

  // Shared with the workers: they may still be pushing after this call has
  // given up on the phase.
  auto results = std::make_shared<ResultChannel>(total);
  for(auto& task : tasks) {
    workers.spawn([results, task = std::move(task)]() {
      try {
        task();
      } catch(...) {
        results->push(std::current_exception());
        return;
      }
      results->push(nullptr);
    });
  }
  log_debug(logger_.get(), "{} phase: dispatched {} tasks", phase, total);

  for(std::size_t current = 1; current <= total; ++current) {
    auto result = results->pop();
    if(result) {
      log_debug(logger_.get(), "{} phase aborted after {}/{} results", phase, current, total);
      std::rethrow_exception(result);
    }
    notify(SyncEvent::progress(phase, current, total));
  }
  workers.join_all();
}

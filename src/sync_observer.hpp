#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

struct ArtifactInfo {
  std::string name;
  uint64_t size = 0;
};

struct SyncEvent {
  enum class Kind { WriteStarted, BackupStarted, ProgressUpdated };

  Kind kind = Kind::ProgressUpdated;

  // WriteStarted
  ArtifactInfo source;
  std::filesystem::path destination;

  // BackupStarted
  std::string name;
  std::filesystem::path from;
  std::filesystem::path to;

  // ProgressUpdated. phase is "write" or "backup".
  std::string phase;
  std::size_t current = 0;
  std::size_t total = 0;

  static SyncEvent write_started(ArtifactInfo source, std::filesystem::path destination);
  static SyncEvent backup_started(std::string name,
                                  std::filesystem::path from,
                                  std::filesystem::path to);
  static SyncEvent progress(std::string phase, std::size_t current, std::size_t total);
};

// Receives sync events. WriteStarted and BackupStarted arrive from transfer
// worker threads, so implementations must be thread-safe.
class SyncObserver {
public:
  virtual ~SyncObserver() = default;
  virtual void on_event(const SyncEvent& event) = 0;
};

class NullSyncObserver : public SyncObserver {
public:
  void on_event(const SyncEvent&) override {}
};

// Adapts plain callbacks; any of them may be left empty.
class CallbackSyncObserver : public SyncObserver {
public:
  using WriteCallback = std::function<void(const ArtifactInfo& source,
                                           const std::filesystem::path& destination)>;
  using BackupCallback = std::function<void(const std::string& name,
                                            const std::filesystem::path& from,
                                            const std::filesystem::path& to)>;
  using ProgressCallback = std::function<void(const std::string& phase,
                                              std::size_t current,
                                              std::size_t total)>;

  WriteCallback on_write;
  BackupCallback on_backup;
  ProgressCallback on_progress;

  void on_event(const SyncEvent& event) override;
};

// Draws one ASCII meter line per phase, e.g.
//   write  [##########..........]  3/6
class ProgressMeterObserver : public SyncObserver {
public:
  ProgressMeterObserver(std::ostream& out, std::size_t meter_size = 40);

  void on_event(const SyncEvent& event) override;

  static std::string format_meter(std::size_t current, std::size_t total, std::size_t slots);

private:
  std::ostream& out_;
  std::size_t meter_size_;
  std::mutex mutex_;
  std::size_t line_width_ = 0;
};

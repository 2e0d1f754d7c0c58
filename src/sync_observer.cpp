#include "sync_observer.hpp"

#include <algorithm>
#include <ostream>

#include <spdlog/fmt/fmt.h>

SyncEvent SyncEvent::write_started(ArtifactInfo source, std::filesystem::path destination) {
  SyncEvent event;
  event.kind = Kind::WriteStarted;
  event.source = std::move(source);
  event.destination = std::move(destination);
  return event;
}

SyncEvent SyncEvent::backup_started(std::string name,
                                    std::filesystem::path from,
                                    std::filesystem::path to) {
  SyncEvent event;
  event.kind = Kind::BackupStarted;
  event.name = std::move(name);
  event.from = std::move(from);
  event.to = std::move(to);
  return event;
}

SyncEvent SyncEvent::progress(std::string phase, std::size_t current, std::size_t total) {
  SyncEvent event;
  event.kind = Kind::ProgressUpdated;
  event.phase = std::move(phase);
  event.current = current;
  event.total = total;
  return event;
}

void CallbackSyncObserver::on_event(const SyncEvent& event) {
  switch(event.kind) {
    case SyncEvent::Kind::WriteStarted:
      if(on_write) on_write(event.source, event.destination);
      break;
    case SyncEvent::Kind::BackupStarted:
      if(on_backup) on_backup(event.name, event.from, event.to);
      break;
    case SyncEvent::Kind::ProgressUpdated:
      if(on_progress) on_progress(event.phase, event.current, event.total);
      break;
  }
}

ProgressMeterObserver::ProgressMeterObserver(std::ostream& out, std::size_t meter_size)
  : out_(out), meter_size_(std::max<std::size_t>(1, meter_size)) {}

std::string ProgressMeterObserver::format_meter(std::size_t current,
                                                std::size_t total,
                                                std::size_t slots) {
  slots = std::max<std::size_t>(1, slots);
  std::size_t filled = slots;
  if(total > 0) {
    filled = std::min(slots, current * slots / total);
  }
  std::string bar(filled, '#');
  bar.append(slots - filled, '.');
  return bar;
}

void ProgressMeterObserver::on_event(const SyncEvent& event) {
  if(event.kind != SyncEvent::Kind::ProgressUpdated) return;
  std::lock_guard<std::mutex> lock(mutex_);
  auto line = fmt::format("\r{:<6} [{}] {}/{}",
                          event.phase,
                          format_meter(event.current, event.total, meter_size_),
                          event.current,
                          event.total);
  out_ << line;
  // clear leftovers from a longer previous line
  if(line.size() < line_width_) {
    out_ << std::string(line_width_ - line.size(), ' ');
  }
  line_width_ = line.size();
  if(event.current >= event.total) {
    out_ << '\n';
    line_width_ = 0;
  }
  out_.flush();
}

#include "sync_engine.hpp"

#include <asio.hpp>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "directory_source.hpp"
#include "mod_server.hpp"
#include "remote_client.hpp"
#include "settings_manager.hpp"
#include "sync_errors.hpp"
#include "sync_observer.hpp"

namespace fs = std::filesystem;

SyncEngine::SyncEngine(std::shared_ptr<SettingsManager> settings, std::shared_ptr<Logger> logger)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("modsync")) {}

std::string SyncEngine::extension() const {
  return settings_->get<std::string>("artifact_extension");
}

InstallPaths SyncEngine::resolve_paths() const {
  auto install_dir = settings_->get<std::string>("install_dir");
  if(!install_dir.empty()) {
    return InstallPaths::from_install_dir(fs::path(install_dir));
  }
  return resolve_install_paths();
}

SyncPolicy SyncEngine::policy() const {
  SyncPolicy policy;
  policy.force = settings_->get<bool>("force");
  policy.keep_existing = settings_->get<bool>("keep_existing");
  return policy;
}

std::unique_ptr<RemoteSource> SyncEngine::make_source() const {
  auto source = settings_->get<std::string>("source");
  if(source.empty()) {
    throw std::invalid_argument("no source given (server host:port or directory)");
  }
  std::error_code ec;
  if(fs::is_directory(source, ec)) {
    return std::make_unique<DirectorySource>(fs::path(source), extension());
  }
  return ServerSource::from_address(source, logger_);
}

SyncSummary SyncEngine::run_sync() {
  auto paths = resolve_paths();
  auto source = make_source();

  std::shared_ptr<SyncObserver> observer;
  if(settings_->get<bool>("transfer_progress")) {
    int width = settings_->get<int>("progress_meter_size");
    observer = std::make_shared<ProgressMeterObserver>(std::cout,
                                                       static_cast<std::size_t>(std::max(1, width)));
  }

  ReconcilerOptions options;
  options.artifact_extension = extension();
  Reconciler reconciler(paths, observer, logger_, options);

  logger_->info("syncing \"{}\" from {}", paths.mods_dir.string(), source->describe());
  return reconciler.sync(*source, policy());
}

void SyncEngine::run_server() {
  fs::path serve_dir = settings_->get<std::string>("serve_dir");
  if(serve_dir.empty()) {
    serve_dir = resolve_paths().mods_dir;
  }
  std::error_code ec;
  if(!fs::is_directory(serve_dir, ec)) {
    throw DirectoryError(serve_dir, "not a directory");
  }

  int port_value = settings_->get<int>("listen_port");
  if(port_value < 0 || port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", port_value);
    throw std::invalid_argument("Invalid listen_port");
  }

  asio::io_context io;
  ModServer server(io,
                   settings_->get<std::string>("listen_ip"),
                   static_cast<unsigned short>(port_value),
                   serve_dir,
                   extension(),
                   logger_);
  server.start_accept();
  logger_->info("serving \"{}\" on port {}", serve_dir.string(), server.port());

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& signal_ec, int signal_number){
    if(signal_ec) return;
    logger_->info("signal {} received, stopping", signal_number);
    server.stop();
    io.stop();
  });
  io.run();
}

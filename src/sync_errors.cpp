#include "sync_errors.hpp"

#include <spdlog/fmt/fmt.h>

NoRemoteArtifacts::NoRemoteArtifacts()
  : SyncError("no server mods to sync") {}

DirectoryError::DirectoryError(std::filesystem::path path, std::string cause)
  : SyncError(fmt::format("directory \"{}\": {}", path.string(), cause)),
    path_(std::move(path)),
    cause_(std::move(cause)) {}

WriteFailed::WriteFailed(std::filesystem::path path, std::string cause)
  : SyncError(fmt::format("writing \"{}\" failed: {}", path.string(), cause)),
    path_(std::move(path)),
    cause_(std::move(cause)) {}

BackupFailed::BackupFailed(std::string name, std::string cause)
  : SyncError(fmt::format("backing up \"{}\" failed: {}", name, cause)),
    name_(std::move(name)),
    cause_(std::move(cause)) {}

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

// Failures a sync run can end with. Per-artifact transfer errors carry the
// artifact they concern; the first one observed is the one a run reports.
class SyncError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The platform install location could not be determined.
class ConfigurationError : public SyncError {
public:
  using SyncError::SyncError;
};

class NoRemoteArtifacts : public SyncError {
public:
  NoRemoteArtifacts();
};

// A required directory could not be listed or created.
class DirectoryError : public SyncError {
public:
  DirectoryError(std::filesystem::path path, std::string cause);

  const std::filesystem::path& path() const { return path_; }
  const std::string& cause() const { return cause_; }

private:
  std::filesystem::path path_;
  std::string cause_;
};

class WriteFailed : public SyncError {
public:
  WriteFailed(std::filesystem::path path, std::string cause);

  const std::filesystem::path& path() const { return path_; }
  const std::string& cause() const { return cause_; }

private:
  std::filesystem::path path_;
  std::string cause_;
};

class BackupFailed : public SyncError {
public:
  BackupFailed(std::string name, std::string cause);

  const std::string& name() const { return name_; }
  const std::string& cause() const { return cause_; }

private:
  std::string name_;
  std::string cause_;
};

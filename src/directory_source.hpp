#pragma once

#include <filesystem>
#include <string>

#include "remote_source.hpp"

// Serves the recognized mods of a local directory, e.g. a server's mods
// folder on a mounted share.
class DirectorySource : public RemoteSource {
public:
  DirectorySource(std::filesystem::path dir, std::string extension);

  // Throws DirectoryError if the directory cannot be listed.
  RemoteArtifactList list_artifacts() override;
  std::string describe() const override;

  const std::filesystem::path& dir() const { return dir_; }

private:
  std::filesystem::path dir_;
  std::string extension_;
};

class FileArtifact : public RemoteArtifact {
public:
  FileArtifact(std::filesystem::path path, uint64_t size);

  const std::string& name() const override { return name_; }
  uint64_t size() const override { return size_; }
  uint64_t write_to(std::ostream& sink) override;

private:
  std::filesystem::path path_;
  std::string name_;
  uint64_t size_;
};

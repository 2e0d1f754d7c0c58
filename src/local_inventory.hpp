#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Snapshot of the recognized artifacts in the mods directory, taken before
// any writes. Transfer tasks claim names as the remote set accounts for
// them; whatever remains afterwards has no remote counterpart.
class LocalInventory {
public:
  LocalInventory() = default;
  LocalInventory(const LocalInventory&) = delete;
  LocalInventory& operator=(const LocalInventory&) = delete;

  // Lists dir non-recursively, keeping entries ending in extension. By
  // default symlinks are recorded with the link's own size and other
  // non-directories are skipped; with follow_symlinks an entry counts when
  // it resolves to a regular file, sized as that file.
  // Throws DirectoryError if the directory cannot be read.
  static std::shared_ptr<LocalInventory> scan(const std::filesystem::path& dir,
                                              const std::string& extension,
                                              bool follow_symlinks = false);

  void add(const std::string& name, uint64_t size);
  std::optional<uint64_t> size_of(const std::string& name) const;
  // Marks name as accounted for. Returns false if it was not present.
  bool claim(const std::string& name);

  std::vector<std::string> names() const;
  std::size_t size() const;
  bool empty() const;

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, uint64_t> sizes_;
};

bool has_artifact_extension(const std::string& filename, const std::string& extension);

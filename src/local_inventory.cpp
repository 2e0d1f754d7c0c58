#include "local_inventory.hpp"

#include <algorithm>

#include "sync_errors.hpp"

namespace fs = std::filesystem;

bool has_artifact_extension(const std::string& filename, const std::string& extension) {
  if(extension.empty()) return true;
  if(filename.size() < extension.size()) return false;
  return filename.compare(filename.size() - extension.size(), extension.size(), extension) == 0;
}

std::shared_ptr<LocalInventory> LocalInventory::scan(const fs::path& dir,
                                                     const std::string& extension,
                                                     bool follow_symlinks) {
  auto inventory = std::make_shared<LocalInventory>();
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) throw DirectoryError(dir, ec.message());

  for(fs::directory_iterator end; it != end; it.increment(ec)) {
    if(ec) throw DirectoryError(dir, ec.message());
    auto name = it->path().filename().string();
    if(!has_artifact_extension(name, extension)) continue;

    std::error_code entry_ec;
    auto status = follow_symlinks ? it->status(entry_ec) : it->symlink_status(entry_ec);
    if(status.type() == fs::file_type::not_found) continue;  // dangling link
    if(entry_ec) throw DirectoryError(it->path(), entry_ec.message());

    uint64_t size = 0;
    if(fs::is_symlink(status)) {
      // a link's own length is the length of its target path
      auto target = fs::read_symlink(it->path(), entry_ec);
      if(entry_ec) throw DirectoryError(it->path(), entry_ec.message());
      size = target.native().size();
    } else if(fs::is_regular_file(status)) {
      size = static_cast<uint64_t>(fs::file_size(it->path(), entry_ec));
      if(entry_ec) throw DirectoryError(it->path(), entry_ec.message());
    } else {
      continue;
    }
    inventory->add(name, size);
  }
  if(ec) throw DirectoryError(dir, ec.message());
  return inventory;
}

void LocalInventory::add(const std::string& name, uint64_t size) {
  std::lock_guard lg(m_);
  sizes_[name] = size;
}

std::optional<uint64_t> LocalInventory::size_of(const std::string& name) const {
  std::lock_guard lg(m_);
  auto it = sizes_.find(name);
  if(it == sizes_.end()) return std::nullopt;
  return it->second;
}

bool LocalInventory::claim(const std::string& name) {
  std::lock_guard lg(m_);
  return sizes_.erase(name) > 0;
}

std::vector<std::string> LocalInventory::names() const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  out.reserve(sizes_.size());
  for(const auto& entry : sizes_) out.push_back(entry.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t LocalInventory::size() const {
  std::lock_guard lg(m_);
  return sizes_.size();
}

bool LocalInventory::empty() const {
  std::lock_guard lg(m_);
  return sizes_.empty();
}

#include "directory_source.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

#include "local_inventory.hpp"

namespace fs = std::filesystem;

DirectorySource::DirectorySource(fs::path dir, std::string extension)
  : dir_(std::move(dir)), extension_(std::move(extension)) {}

RemoteArtifactList DirectorySource::list_artifacts() {
  auto inventory = LocalInventory::scan(dir_, extension_, true);
  RemoteArtifactList artifacts;
  for(const auto& name : inventory->names()) {
    artifacts.push_back(std::make_shared<FileArtifact>(dir_ / name, *inventory->size_of(name)));
  }
  return artifacts;
}

std::string DirectorySource::describe() const {
  return "directory \"" + dir_.string() + "\"";
}

FileArtifact::FileArtifact(fs::path path, uint64_t size)
  : path_(std::move(path)), name_(path_.filename().string()), size_(size) {}

uint64_t FileArtifact::write_to(std::ostream& sink) {
  std::ifstream in(path_, std::ios::binary);
  if(!in) throw std::runtime_error("cannot open " + path_.string());

  std::vector<char> buffer(64 * 1024);
  uint64_t total = 0;
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got <= 0) break;
    sink.write(buffer.data(), got);
    if(!sink) throw std::runtime_error("sink rejected data");
    total += static_cast<uint64_t>(got);
  }
  if(in.bad()) throw std::runtime_error("read error on " + path_.string());
  return total;
}

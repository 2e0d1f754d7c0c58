#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// A mod offered by a server. The transfer side streams it once with
// write_to() and then releases it with close().
class RemoteArtifact {
public:
  virtual ~RemoteArtifact() = default;

  virtual const std::string& name() const = 0;
  virtual uint64_t size() const = 0;

  // Streams the full contents into sink and returns the number of bytes
  // written. Throws on transport or sink failure.
  virtual uint64_t write_to(std::ostream& sink) = 0;

  // Releases whatever the artifact holds. Only the first call reaches
  // do_close(); later calls return immediately.
  void close() {
    if(closed_.exchange(true)) return;
    do_close();
  }

  bool closed() const { return closed_.load(); }

protected:
  virtual void do_close() {}

private:
  std::atomic<bool> closed_{false};
};

using RemoteArtifactList = std::vector<std::shared_ptr<RemoteArtifact>>;

class RemoteSource {
public:
  virtual ~RemoteSource() = default;

  virtual RemoteArtifactList list_artifacts() = 0;
  virtual std::string describe() const = 0;
};

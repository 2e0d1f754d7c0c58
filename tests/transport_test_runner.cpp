#include "directory_source.hpp"
#include "mod_server.hpp"
#include "protocol.hpp"
#include "reconciler.hpp"
#include "remote_client.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_errors.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <map>
#include <sstream>
#include <thread>

namespace {

using namespace modsync::test;
namespace fs = std::filesystem;

// ModServer on an ephemeral loopback port, driven by a background thread.
class ServerFixture {
public:
  explicit ServerFixture(const fs::path& serve_dir)
    : logger_(std::make_shared<Logger>("mod-server")),
      server_(io_, "127.0.0.1", 0, serve_dir, ".jar", logger_) {
    server_.start_accept();
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~ServerFixture() {
    asio::post(io_, [this]{ server_.stop(); });
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  unsigned short port() const { return server_.port(); }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  asio::io_context io_;
  std::shared_ptr<Logger> logger_;
  ModServer server_;
  std::thread thread_;
};

// Bytes that differ from position to position, so misplaced chunks show.
std::string patterned_content(std::size_t size, unsigned seed) {
  std::string out(size, '\0');
  uint32_t state = seed * 2654435761u + 1;
  for(std::size_t i = 0; i < size; ++i) {
    state = state * 1664525u + 1013904223u;
    out[i] = static_cast<char>(state >> 24);
  }
  return out;
}

bool test_listing_over_tcp(TestContext& ctx) {
  TempWorkspace workspace("listing");
  auto served = workspace / "server";
  write_file(served / "a.jar", 100);
  write_file(served / "b.jar", 5);
  write_file(served / "notes.txt", 9);

  ServerFixture server(served);
  ctx.logs.attach(server.logger());
  ServerSource source("127.0.0.1", server.port());
  auto artifacts = source.list_artifacts();

  std::map<std::string, uint64_t> listed;
  for(const auto& artifact : artifacts) listed[artifact->name()] = artifact->size();
  return listed == std::map<std::string, uint64_t>{{"a.jar", 100}, {"b.jar", 5}};
}

bool test_sync_over_tcp(TestContext& ctx) {
  TempWorkspace workspace("tcp_sync");
  auto served = workspace / "server";
  auto big = patterned_content(3 * kTransferBufferSize + 123, 7);
  write_file(served / "a.jar", make_content(100, 'a'));
  write_file(served / "c.jar", make_content(30, 'c'));
  write_file(served / "big.jar", big);

  auto paths = InstallPaths::from_install_dir(workspace / "client");
  write_file(paths.mods_dir / "a.jar", make_content(100, 'a'));
  write_file(paths.mods_dir / "b.jar", make_content(50, 'b'));

  ServerFixture server(served);
  auto logger = std::make_shared<Logger>("reconciler");
  ctx.logs.attach(server.logger(), "server");
  ctx.logs.attach(logger, "client");

  ServerSource source("127.0.0.1", server.port(), logger);
  Reconciler reconciler(paths, nullptr, logger);
  auto summary = reconciler.sync(source, SyncPolicy{});

  return list_files(paths.mods_dir) == std::vector<std::string>{"a.jar", "big.jar", "c.jar"} &&
         read_file(paths.mods_dir / "big.jar") == big &&
         read_file(paths.mods_dir / "c.jar") == make_content(30, 'c') &&
         list_files(paths.backup_dir) == std::vector<std::string>{"b.jar"} &&
         summary.written == 2 && summary.skipped == 1;
}

bool test_unknown_mod_is_refused(TestContext& ctx) {
  TempWorkspace workspace("unknown_mod");
  auto served = workspace / "server";
  fs::create_directories(served);
  ServerFixture server(served);
  ctx.logs.attach(server.logger());

  int refused = 0;
  for(const std::string name : {"missing.jar", "../escape.jar", "notes.txt"}) {
    NetworkArtifact artifact("127.0.0.1", server.port(), name, 3);
    std::ostringstream sink;
    try {
      artifact.write_to(sink);
    } catch(const std::runtime_error& e) {
      if(std::string(e.what()).find("server error") != std::string::npos) ++refused;
    }
    artifact.close();
  }
  return refused == 3;
}

bool test_mod_changed_between_list_and_fetch(TestContext& ctx) {
  TempWorkspace workspace("changed_mod");
  auto served = workspace / "server";
  write_file(served / "a.jar", 10);
  auto paths = InstallPaths::from_install_dir(workspace / "client");

  ServerFixture server(served);
  auto logger = std::make_shared<Logger>("reconciler");
  ctx.logs.attach(server.logger(), "server");
  ctx.logs.attach(logger, "client");

  ServerSource source("127.0.0.1", server.port(), logger);
  auto artifacts = source.list_artifacts();
  write_file(served / "a.jar", 12);

  Reconciler reconciler(paths, nullptr, logger);
  try {
    reconciler.sync(artifacts, SyncPolicy{});
    return false;
  } catch(const WriteFailed& e) {
    return e.path() == paths.mods_dir / "a.jar" &&
           e.cause().find("changed on server") != std::string::npos &&
           artifacts[0]->closed();
  }
}

// Listing failures surface as std::runtime_error, which the command line
// reports as an ordinary failed run.
bool test_unreachable_server_listing_fails(TestContext& ctx) {
  TempWorkspace workspace("unreachable");
  fs::create_directories(workspace / "server");
  unsigned short port = 0;
  {
    ServerFixture server(workspace / "server");
    port = server.port();
  }

  auto logger = std::make_shared<Logger>("client");
  ctx.logs.attach(logger);
  ServerSource source("127.0.0.1", port, logger);
  try {
    source.list_artifacts();
    return false;
  } catch(const std::runtime_error& e) {
    return std::string(e.what()).find("cannot list mods from server 127.0.0.1:") != std::string::npos;
  }
}

bool test_listing_names_are_validated(TestContext&) {
  json good = make_list_response({{"a.jar", 1}, {"b.jar", 2}});
  auto mods = parse_list_response(good);

  int rejected = 0;
  for(const std::string bad : {"../evil.jar", "dir/x.jar", "", ".."}) {
    try {
      parse_list_response(make_list_response({{bad, 1}}));
    } catch(const std::runtime_error&) {
      ++rejected;
    }
  }
  try {
    parse_list_response(make_error("disk on fire"));
  } catch(const std::runtime_error& e) {
    if(std::string(e.what()).find("disk on fire") != std::string::npos) ++rejected;
  }
  return mods.size() == 2 && mods[1].name == "b.jar" && mods[1].size == 2 && rejected == 5;
}

bool test_server_address_parsing(TestContext&) {
  auto source = ServerSource::from_address("mc.example.net:25585");
  int rejected = 0;
  for(const std::string bad : {"mc.example.net", ":25585", "host:", "host:99999", "host:abc"}) {
    try {
      ServerSource::from_address(bad);
    } catch(const std::invalid_argument&) {
      ++rejected;
    }
  }
  return source->host() == "mc.example.net" && source->port() == 25585 && rejected == 5;
}

bool test_directory_source_sync(TestContext& ctx) {
  TempWorkspace workspace("directory_source");
  auto served = workspace / "share";
  auto content = patterned_content(70000, 3);
  write_file(served / "lib.jar", content);
  write_file(served / "skip.me", 4);
  auto paths = InstallPaths::from_install_dir(workspace / "client");

  auto logger = std::make_shared<Logger>("reconciler");
  ctx.logs.attach(logger);
  DirectorySource source(served, ".jar");
  Reconciler reconciler(paths, nullptr, logger);
  reconciler.sync(source, SyncPolicy{});

  return list_files(paths.mods_dir) == std::vector<std::string>{"lib.jar"} &&
         read_file(paths.mods_dir / "lib.jar") == content &&
         sha256_file_hex(paths.mods_dir / "lib.jar") == sha256_hex(content);
}

bool test_engine_runs_sync_from_settings(TestContext& ctx) {
  TempWorkspace workspace("engine");
  write_file(workspace / "share" / "x.jar", 6);
  write_file(workspace / "install" / "mods" / "y.jar", 2);

  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  bool configured =
    settings->set_from_string("source", (workspace / "share").string(), error) &&
    settings->set_from_string("install_dir", (workspace / "install").string(), error) &&
    settings->set_from_string("transfer_progress", "false", error);
  if(!configured) return false;

  auto logger = std::make_shared<Logger>("modsync");
  ctx.logs.attach(logger);
  SyncEngine engine(settings, logger);
  auto summary = engine.run_sync();

  auto mods = workspace / "install" / "mods";
  bool directory_selected = dynamic_cast<DirectorySource*>(engine.make_source().get()) != nullptr;

  if(!settings->set_from_string("source", "127.0.0.1:1", error)) return false;
  bool server_selected = dynamic_cast<ServerSource*>(engine.make_source().get()) != nullptr;

  return summary.written == 1 && summary.orphans_backed_up == 1 &&
         list_files(mods) == std::vector<std::string>{"x.jar"} &&
         list_files(mods / "backup") == std::vector<std::string>{"y.jar"} &&
         directory_selected && server_selected;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"listing_over_tcp", test_listing_over_tcp},
    {"sync_over_tcp", test_sync_over_tcp},
    {"unknown_mod_is_refused", test_unknown_mod_is_refused},
    {"mod_changed_between_list_and_fetch", test_mod_changed_between_list_and_fetch},
    {"unreachable_server_listing_fails", test_unreachable_server_listing_fails},
    {"listing_names_are_validated", test_listing_names_are_validated},
    {"server_address_parsing", test_server_address_parsing},
    {"directory_source_sync", test_directory_source_sync},
    {"engine_runs_sync_from_settings", test_engine_runs_sync_from_settings},
  };
  return run_test_cases("transport", std::move(tests), argc, argv);
}

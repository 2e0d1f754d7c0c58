#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <stdexcept>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"
#include "sync_errors.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "modsync");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("modsync");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    SyncEngine engine(settings, logger);
    try {
      if(settings->get<bool>("serve")) {
        engine.run_server();
      } else {
        engine.run_sync();
      }
    } catch(const SyncError& e) {
      logger->error("{}", e.what());
      return 1;
    } catch(const std::invalid_argument& e) {
      logger->error("{}", e.what());
      parser.usage();
      return 1;
    } catch(const std::runtime_error& e) {
      // unreachable server, error replies, broken transfers
      logger->error("{}", e.what());
      return 1;
    }
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("modsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

struct DefaultLoggers {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

DefaultLoggers g_loggers;
std::mutex g_loggers_mutex;
std::atomic<bool> g_log_passthrough{true};
std::filesystem::path g_log_file;

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    bool to_stderr,
                                                    const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

void create_loggers_locked() {
  if(g_loggers.info) return;

  g_loggers.info = make_console_logger("modsync.info", false, kStampedPattern);
  g_loggers.error = make_console_logger("modsync.error", true, kStampedPattern);
  g_loggers.print = make_console_logger("modsync.print", false, "%v");
  g_loggers.print_err = make_console_logger("modsync.print_err", true, "%v");

  g_loggers.info->flush_on(spdlog::level::warn);
  g_loggers.error->flush_on(spdlog::level::err);
  g_loggers.print->flush_on(spdlog::level::info);
  g_loggers.print_err->flush_on(spdlog::level::err);
}

const DefaultLoggers& ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  create_loggers_locked();
  return g_loggers;
}

void attach_file_sink_locked(const std::filesystem::path& log_file) {
  if(log_file.empty() || log_file == g_log_file) return;
  std::error_code ec;
  if(log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
  file_sink->set_pattern(kFilePattern);
  for(auto* logger : {&g_loggers.info, &g_loggers.error, &g_loggers.print, &g_loggers.print_err}) {
    (*logger)->sinks().push_back(file_sink);
  }
  g_log_file = log_file;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

void init(bool verbose, const std::filesystem::path& log_file) {
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  {
    std::lock_guard<std::mutex> lock(g_loggers_mutex);
    create_loggers_locked();
    attach_file_sink_locked(log_file);
    g_loggers.info->set_level(level);
    g_loggers.error->set_level(spdlog::level::info);
    g_loggers.print->set_level(spdlog::level::info);
    g_loggers.print_err->set_level(spdlog::level::info);
    spdlog::set_default_logger(g_loggers.info);
  }
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  const auto& loggers = ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = loggers.print.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = loggers.print_err.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = loggers.error.get();
  } else {
    sink = loggers.info.get();
  }

  if(!sink) return;
  if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail

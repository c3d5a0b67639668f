#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <exception>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void ensure_loggers() {
  std::call_once(g_create_once, [](){
    const char* stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_info_logger = make_logger("bulkftp.info",
                                std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                stamped, spdlog::level::warn);
    g_error_logger = make_logger("bulkftp.error",
                                 std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                 stamped, spdlog::level::err);
    g_print_logger = make_logger("bulkftp.print",
                                 std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                 "%v", spdlog::level::info);
    g_print_err_logger = make_logger("bulkftp.print_err",
                                     std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                     "%v", spdlog::level::err);
  });
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(const char* channel,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  std::string channel_name = name_.empty() ? std::string(channel) : name_ + ":" + channel;
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(channel, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log-listener", spdlog::level::err,
                              fmt::format("listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = g_info_logger.get();
  bool plain = false;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  }

  // command output goes out verbatim
  if(plain || channel_name.empty() || channel_name == base_channel) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  }
}

} // namespace detail

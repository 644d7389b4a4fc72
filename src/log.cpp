#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {
std::mutex g_sink_mutex;
std::shared_ptr<spdlog::logger> g_main_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::atomic<bool> g_log_passthrough{true};

void create_loggers_locked() {
  if(g_main_logger) return;

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  g_main_logger = std::make_shared<spdlog::logger>("lansync", std::move(console_sink));
  g_print_logger = std::make_shared<spdlog::logger>("lansync.print", std::move(plain_out_sink));

  g_main_logger->flush_on(spdlog::level::warn);
  g_print_logger->flush_on(spdlog::level::info);
  g_main_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
}

std::shared_ptr<spdlog::logger> main_logger() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();
  return g_main_logger;
}

std::shared_ptr<spdlog::logger> print_logger() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();
  return g_print_logger;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();

  if(!log_file.empty() && !g_file_sink) {
    // spdlog throws spdlog_ex when the file cannot be opened; let it reach the caller.
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    g_file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    g_main_logger->sinks().push_back(g_file_sink);
  }

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_main_logger->set_level(level);
  spdlog::set_default_logger(g_main_logger);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return name_;
}

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

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
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
      detail::emit_to_default("log", spdlog::level::warn,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(channel, level, message);
}

void Logger::detail_print(const std::string& message) {
  detail::emit_print(message);
}

namespace detail {

void emit_to_default(const std::string& channel,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto sink = main_logger();
  if(!channel.empty()) {
    sink->log(level, "[{}] {}", channel, message);
  } else {
    sink->log(level, "{}", message);
  }
}

void emit_print(const std::string& message) {
  if(!log_passthrough()) return;
  print_logger()->info("{}", message);
}

} // namespace detail

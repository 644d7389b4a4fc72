#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Configures the shared sinks. Safe to call more than once; the last call
// wins for the level and an optional file sink is attached on first use.
void init(bool verbose = false, const std::string& log_file = std::string());
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  // Console output meant for the operator, not the log file.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch("print", spdlog::level::info, formatted)) return;
    detail_print(formatted);
  }

private:
  template<typename... Args>
  void log(spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    const auto channel = name();
    if(dispatch(channel, level, formatted)) return;
    fallback(channel, level, formatted);
  }

  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);
  void fallback(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);
  void detail_print(const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex name_mutex_;
  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_default(const std::string& channel,
                     spdlog::level::level_enum level,
                     const std::string& message);
void emit_print(const std::string& message);

template<typename... Args>
void log_with_fallback(spdlog::level::level_enum level,
                       spdlog::format_string_t<Args...> fmt,
                       Args&&... args) {
  auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
  emit_to_default(std::string(), level, formatted);
}
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->info(fmt, std::forward<Args>(args)...);
  } else {
    detail::log_with_fallback(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }
}

template<typename... Args>
inline void log_warn(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else {
    detail::log_with_fallback(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }
}

template<typename... Args>
inline void log_error(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->error(fmt, std::forward<Args>(args)...);
  } else {
    detail::log_with_fallback(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }
}

template<typename... Args>
inline void log_debug(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->debug(fmt, std::forward<Args>(args)...);
  } else {
    detail::log_with_fallback(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }
}

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_print(fmt::format(fmt, std::forward<Args>(args)...));
  }
}

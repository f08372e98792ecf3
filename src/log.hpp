#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Configures the shared stderr sink. verbose lowers the threshold to debug,
// quiet raises it to error so advisory warnings disappear.
void init(bool verbose = false, bool quiet = false);

// When off, records reach listeners only. The TUI turns this off while it
// owns the terminal, the test runners while they capture.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named per-component logger. Records go to every attached listener, then to
// the shared sink unless a listener consumed them.
class Logger {
public:
  using Listener = std::function<bool(const std::string& component,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string component);

  const std::string& component() const { return component_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!wants(level)) return;
    write(level, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  bool wants(spdlog::level::level_enum level) const;
  void write(spdlog::level::level_enum level, const std::string& message);

  std::string component_;
  std::mutex mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_handle_ = 1;
  std::atomic<std::size_t> listener_count_{0};
};

// Loggers are shared by component name so the TUI and the test runners can
// attach to every component at once.
std::shared_ptr<Logger> component_logger(const std::string& name);
std::vector<std::shared_ptr<Logger>> component_loggers();

namespace detail {
void emit_unowned(spdlog::level::level_enum level, const std::string& message);

template<typename... Args>
void log_at(Logger* logger, spdlog::level::level_enum level,
            spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->log(level, fmt, std::forward<Args>(args)...);
  } else {
    emit_unowned(level, fmt::format(fmt, std::forward<Args>(args)...));
  }
}
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_at(logger, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_at(logger, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_at(logger, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_at(logger, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

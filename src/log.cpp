#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::shared_ptr<spdlog::logger> g_sink_logger;
std::once_flag g_sink_once;
std::atomic<bool> g_passthrough{true};

std::mutex g_registry_mutex;
std::map<std::string, std::shared_ptr<Logger>> g_registry;

// stdout belongs to command output, so diagnostics only ever use stderr.
spdlog::logger& sink_logger() {
  std::call_once(g_sink_once, []{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    g_sink_logger = std::make_shared<spdlog::logger>("kizuna", std::move(sink));
    g_sink_logger->set_level(spdlog::level::warn);
    g_sink_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(g_sink_logger);
  });
  return *g_sink_logger;
}

} // namespace

void init(bool verbose, bool quiet) {
  auto level = spdlog::level::warn;
  if(verbose) {
    level = spdlog::level::debug;
  } else if(quiet) {
    level = spdlog::level::err;
  }
  sink_logger().set_level(level);
  spdlog::set_default_logger(g_sink_logger);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

bool log_passthrough() {
  return g_passthrough.load();
}

Logger::Logger(std::string component) : component_(std::move(component)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  auto handle = next_handle_++;
  listeners_.emplace(handle, std::move(listener));
  listener_count_.store(listeners_.size());
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
  listener_count_.store(listeners_.size());
}

// Listeners see everything; the sink only what its level lets through.
bool Logger::wants(spdlog::level::level_enum level) const {
  return listener_count_.load() > 0 || (log_passthrough() && sink_logger().should_log(level));
}

void Logger::write(spdlog::level::level_enum level, const std::string& message) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& listener : listeners) {
    try {
      consumed = listener(component_, level, message) || consumed;
    } catch(const std::exception& e) {
      detail::emit_unowned(spdlog::level::err, fmt::format("log listener for {} failed: {}", component_, e.what()));
    }
  }
  if(consumed || !log_passthrough()) return;
  sink_logger().log(level, "[{}] {}", component_, message);
}

std::shared_ptr<Logger> component_logger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  auto& slot = g_registry[name];
  if(!slot) slot = std::make_shared<Logger>(name);
  return slot;
}

std::vector<std::shared_ptr<Logger>> component_loggers() {
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  std::vector<std::shared_ptr<Logger>> out;
  for(const auto& entry : g_registry) out.push_back(entry.second);
  return out;
}

namespace detail {

void emit_unowned(spdlog::level::level_enum level, const std::string& message) {
  if(!log_passthrough()) return;
  sink_logger().log(level, message);
}

} // namespace detail

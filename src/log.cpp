#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "prmerge";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
// Shared by every prmerge logger; sinks are only added or removed through it.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_sinks;
spdlog::sink_ptr g_file_sink;
std::string g_log_file;
std::mutex g_logger_mutex;
std::mutex g_thread_pool_mutex;

/// Thread pool backing the async loggers, recreated after spdlog::shutdown().
std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  std::lock_guard<std::mutex> lock(g_thread_pool_mutex);
  auto pool = spdlog::thread_pool();
  if (!pool) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Create the file sink for @p file.
 *
 * @param file Log file path.
 * @param rotate_files Number of rotated files to keep; zero disables rotation.
 * @return Rotating sink, or a plain truncating file sink without rotation.
 */
spdlog::sink_ptr make_file_sink(const std::string &file,
                                std::size_t rotate_files) {
  if (rotate_files > 0) {
    return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file, kMaxLogFileSize, rotate_files);
  }
  return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
}

bool owned_logger(const std::string &name) {
  return name.rfind(kRootLoggerName, 0) == 0;
}

/// Replace the file sink inside the shared distribution sink.
void attach_file_sink(const std::string &file, std::size_t rotate_files) {
  auto sink = make_file_sink(file, rotate_files);
  if (g_file_sink) {
    g_sinks->remove_sink(g_file_sink);
  }
  g_sinks->add_sink(sink);
  g_file_sink = std::move(sink);
  g_log_file = file;
}
} // namespace

namespace prmerge {

/**
 * Initialize the global spdlog logger.
 *
 * The first call creates the asynchronous root logger and its sinks. Later
 * calls reset the level of every prmerge logger and swap the file sink when
 * a new file is requested. Loggers never have their own sink lists changed;
 * file sinks come and go inside the shared distribution sink.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  auto pool = logging_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    g_sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_sinks->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    g_file_sink.reset();
    g_log_file.clear();
    if (!file.empty()) {
      attach_file_sink(file, rotate_files);
    }
    logger = std::make_shared<spdlog::async_logger>(
        kRootLoggerName, g_sinks, pool, spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  } else if (!file.empty() && file != g_log_file) {
    attach_file_sink(file, rotate_files);
  }
  spdlog::apply_all([level](std::shared_ptr<spdlog::logger> existing) {
    if (owned_logger(existing->name())) {
      existing->set_level(level);
    }
  });
  lock.unlock();
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  auto pool = logging_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto root = spdlog::get(kRootLoggerName);
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    root = spdlog::get(kRootLoggerName);
  }
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, g_sinks, pool, spdlog::async_overflow_policy::block);
  new_logger->set_level(root->level());
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace prmerge

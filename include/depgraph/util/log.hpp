#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>

namespace depgraph::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      ""
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return Level::Info;
}

// Synchronous logger. Lines go to stderr (colored when it is a terminal) and
// to an optional append-only log file.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::mutex mu_;
  std::FILE* file_{nullptr};
  bool color_{false};

public:
  Logger() : color_(::isatty(STDERR_FILENO) != 0) {}
  ~Logger() { close_file(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  // Returns false when the file cannot be opened; stderr output continues.
  auto open_file(const std::string& path) -> bool {
    std::lock_guard lock(mu_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
  }

  auto close_file() -> void {
    std::lock_guard lock(mu_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire) || level == Level::Off)
      return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto message = std::format(fmt, std::forward<Args>(args)...);

    std::lock_guard lock(mu_);
    if (color_) {
      std::print(stderr, "[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] {}\n", now,
                 level_color(level), level_name(level), message);
    } else {
      std::print(stderr, "[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", now,
                 level_name(level), message);
    }
    if (file_ != nullptr) {
      std::print(file_, "[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", now,
                 level_name(level), message);
      std::fflush(file_);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_file(const std::string& path) -> bool {
  return logger().open_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace depgraph::log

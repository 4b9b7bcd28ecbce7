#pragma once

#include "depgraph/util/id.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace depgraph {

inline auto format_timestamp() -> std::string {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
}

[[nodiscard]] inline auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

[[nodiscard]] inline auto contains_any(std::string_view haystack,
                                       std::initializer_list<std::string_view> needles)
    -> bool {
  return std::ranges::any_of(needles, [haystack](std::string_view n) {
    return haystack.find(n) != std::string_view::npos;
  });
}

// "a → b → c", the arrow form used in issue descriptions and log lines.
[[nodiscard]] inline auto join_path(std::span<const TaskId> ids)
    -> std::string {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) {
      out += " → ";
    }
    out += id.value();
  }
  return out;
}

}  // namespace depgraph

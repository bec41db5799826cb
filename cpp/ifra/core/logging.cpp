/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/ifra/core/logging.cpp
===========================================================
*/

#include "ifra/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ifra {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool parse_log_level(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  if (iequals(s, "debug")) { *out = LogLevel::DEBUG; return true; }
  if (iequals(s, "info"))  { *out = LogLevel::INFO;  return true; }
  if (iequals(s, "warn"))  { *out = LogLevel::WARN;  return true; }
  if (iequals(s, "error")) { *out = LogLevel::ERROR; return true; }
  return false;
}

// 2026-01-31T12:00:00.123Z
static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t tt = clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    std::ostringstream line;
    line << utc_timestamp() << ' ' << std::left << std::setw(5) << level_tag(lvl) << " ifra: " << msg << '\n';
    const std::string text = line.str();

    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << text;
    out.flush();
  } catch (...) {
    // Must never throw.
  }
}

} // namespace ifra

#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace livetranslate {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

namespace {

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) % 1000;

  std::tm tm{};
  localtime_r(&seconds, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << millis.count();
  return ss.str();
}

} // namespace

void Logger::initialize(LogLevel level) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    if (initialized_) {
      return;
    }
    initialized_ = true;
  }
  info("Logger initialized (level " + levelToString(level) + ")");
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, message);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG") {
    return LogLevel::DEBUG;
  }
  if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::WARN;
  }
  if (upper == "ERROR") {
    return LogLevel::ERROR;
  }
  return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "INFO";
}

void Logger::write(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }

  std::ostream &out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
  out << "[" << timestamp() << "] [" << levelToString(level) << "] " << message
      << std::endl;
}

} // namespace utils
} // namespace livetranslate

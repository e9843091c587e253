#include "logger.h"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
const char *LevelTag(LogLevel level) {
  switch (level) {
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Info:
  default:
    return "INFO";
  }
}
} // namespace

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() {
  const char *path = std::getenv("INSPECTRA_LOG_FILE");
  file_.open(path && *path ? path : "inspectra.log",
             std::ios::out | std::ios::trunc);
  worker_ = std::thread(&Logger::Worker, this);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
  if (file_.is_open())
    file_.close();
}

std::string Logger::FormatLine(LogLevel level, const std::string &msg) {
  const std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  std::ostringstream line;
  line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " [" << LevelTag(level)
       << "] " << msg;
  return line.str();
}

void Logger::Log(const std::string &msg) { Log(LogLevel::Info, msg); }

void Logger::Log(LogLevel level, const std::string &msg) {
  std::string line = FormatLine(level, msg);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(line));
  }
  cv_.notify_one();
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return done_ || !queue_.empty(); });
    if (done_ && queue_.empty())
      break;
    auto msg = queue_.front();
    queue_.pop();
    lock.unlock();
    if (file_.is_open()) {
      file_ << msg << std::endl;
      file_.flush();
    }
    std::cerr << msg << std::endl;
    lock.lock();
  }
}

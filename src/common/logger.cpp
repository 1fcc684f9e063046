#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

static std::string NowToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

static std::string BaseName(const std::string& path) {
  auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  if (s == "DEBUG") return LogLevel::DEBUG;
  if (s == "INFO") return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING") return LogLevel::WARNING;
  if (s == "ERROR") return LogLevel::ERROR;
  if (s == "CRIT" || s == "CRITICAL") return LogLevel::CRITICAL;
  return fallback;
}

void Logger::Initialize(const std::string& path, LogLevel min_level) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) {
    instance_->min_level_ = min_level;
    return;
  }
  instance_.reset(new Logger());
  instance_->min_level_ = min_level;
  if (path.empty()) {
    instance_->to_stderr_ = true;
  } else {
    instance_->log_file_.open(path, std::ios::out | std::ios::app);
    if (!instance_->log_file_.is_open()) {
      std::cerr << "Failed to open log file: " << path << ", logging to stderr" << std::endl;
      instance_->to_stderr_ = true;
    }
  }
  instance_->running_ = true;
  instance_->worker_thread_ = std::thread(&Logger::WorkerFunction, instance_.get());
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  // ~Logger drains the queue and joins the worker
}

void Logger::StopWorker() {
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
  if (log_file_.is_open()) log_file_.close();
}

// Also runs at static destruction when Shutdown() was never called, so it must not touch instance_.
Logger::~Logger() { StopWorker(); }

bool Logger::IsInitialized() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return static_cast<bool>(instance_);
}

void Logger::Flush() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  std::unique_lock<std::mutex> qlock(instance_->log_mutex_);
  instance_->drained_cv_.wait(qlock, [&]{
    return (instance_->log_queue_.empty() && !instance_->writing_) || !instance_->running_;
  });
}

void Logger::WorkerFunction() {
  while (true) {
    std::unique_lock<std::mutex> lock(log_mutex_);
    cv_.wait(lock, [&]{ return !log_queue_.empty() || !running_; });
    if (!running_ && log_queue_.empty()) break;
    auto entry = std::move(log_queue_.front());
    log_queue_.pop();
    writing_ = true;
    lock.unlock();
    WriteLogEntry(entry);
    lock.lock();
    writing_ = false;
    if (log_queue_.empty()) drained_cv_.notify_all();
  }
  drained_cv_.notify_all();
}

std::string Logger::LevelToString(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

std::string Logger::FormatLogEntry(const LogEntry& e) {
  std::ostringstream oss;
  oss << NowToString(e.timestamp) << " [" << LevelToString(e.level) << "]"
      << " (" << e.thread_id << ") " << BaseName(e.file) << ":" << e.line << " - "
      << e.message << '\n';
  return oss.str();
}

void Logger::WriteLogEntry(const LogEntry& e) {
  std::string line = FormatLogEntry(e);
  if (to_stderr_) {
    std::cerr << line;
    std::cerr.flush();
  } else if (log_file_.is_open()) {
    log_file_ << line;
    log_file_.flush();
  }
}

void Logger::Log(LogLevel level, const std::string& message, const char* file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  if (level < instance_->min_level_) return;
  LogEntry e{std::chrono::system_clock::now(), level, message, file ? file : "", line, std::this_thread::get_id()};
  {
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->log_queue_.push(std::move(e));
  }
  instance_->cv_.notify_one();
}

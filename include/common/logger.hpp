#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
  std::thread::id thread_id;
};

// Parses DEBUG/INFO/WARN/WARNING/ERROR/CRIT/CRITICAL (case-insensitive).
// Returns fallback for anything else.
LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

// Process-wide asynchronous logger. Entries are queued by the caller and written
// by a worker thread. Without Initialize() every call is a no-op.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  bool to_stderr_ = false;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  std::condition_variable drained_cv_;
  bool running_ = false;
  bool writing_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void StopWorker();
  void WriteLogEntry(const LogEntry&);
  static std::string FormatLogEntry(const LogEntry&);
  static std::string LevelToString(LogLevel);
public:
  // An empty path sends output to stderr.
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO);
  static void Shutdown();
  static bool IsInitialized();
  // Blocks until every queued entry has been written.
  static void Flush();
  static void Log(LogLevel level, const std::string& message, const char* file, int line);
  ~Logger();
};

#define ALT_LOG_DEBUG(msg) Logger::Log(LogLevel::DEBUG, (msg), __FILE__, __LINE__)
#define ALT_LOG_INFO(msg) Logger::Log(LogLevel::INFO, (msg), __FILE__, __LINE__)
#define ALT_LOG_WARNING(msg) Logger::Log(LogLevel::WARNING, (msg), __FILE__, __LINE__)
#define ALT_LOG_ERROR(msg) Logger::Log(LogLevel::ERROR, (msg), __FILE__, __LINE__)
#define ALT_LOG_CRITICAL(msg) Logger::Log(LogLevel::CRITICAL, (msg), __FILE__, __LINE__)

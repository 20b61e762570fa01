#ifndef __SYNOD_LOGGING_H_
#define __SYNOD_LOGGING_H_

#include <sstream>
#include <functional>
#include <string.h>

namespace synod {

class LogStream : public std::ostringstream {};

class Logger {
 public:
  enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    NUM_LOG_LEVELS,
  };

  // basename of source file, computed without allocation
  class SourceFile {
   public:
    template <int N>
    SourceFile(const char (&arr)[N]) : data_(arr), size_(N - 1) {
      const char* slash = strrchr(data_, '/');
      if (slash) {
        data_ = slash + 1;
        size_ -= static_cast<int>(data_ - arr);
      }
    }

    explicit SourceFile(const char* filename) : data_(filename) {
      const char* slash = strrchr(filename, '/');
      if (slash) {
        data_ = slash + 1;
      }
      size_ = static_cast<int>(strlen(data_));
    }

    const char* data_;
    int size_;
  };

  Logger(SourceFile file, int line);
  Logger(SourceFile file, int line, LogLevel level);
  ~Logger();

  LogStream& stream() { return impl_.stream_; }

  static LogLevel logLevel();
  static void setLogLevel(LogLevel level);

  // parse "trace", "debug", "info", "warn", "error" or "fatal".
  static bool parseLogLevel(const std::string& name, LogLevel& level);

  using FlushFunc = std::function<void()>;
  using OutputFunc = std::function<void(const char*, int)>;

  static void setFlush(FlushFunc);
  static void setOutput(OutputFunc);
  static void resetFlush();
  static void resetOutput();

 private:
  class Impl {
   public:
    using LogLevel = Logger::LogLevel;
    Impl(LogLevel level, const SourceFile& file, int line);
    void formatTime();
    void finish();

    int line_;
    LogLevel level_;

    LogStream stream_;
    SourceFile basename_;
  };

  Impl impl_;
};

extern Logger::LogLevel g_logLevel;
inline Logger::LogLevel Logger::logLevel() { return g_logLevel; }

}  // namespace synod

#define SYNOD_LOG(level) \
  if (::synod::Logger::logLevel() > ::synod::Logger::level) \
    ;                                                       \
  else                                                      \
    ::synod::Logger(__FILE__, __LINE__, ::synod::Logger::level).stream()

#define LOG_TRACE SYNOD_LOG(TRACE)
#define LOG_DEBUG SYNOD_LOG(DEBUG)
#define LOG_INFO SYNOD_LOG(INFO)
#define LOG_WARN SYNOD_LOG(WARN)
#define LOG_ERR SYNOD_LOG(ERROR)

#endif

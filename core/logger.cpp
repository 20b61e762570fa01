#include "logger.h"

#include <mutex>
#include <stdio.h>
#include <assert.h>
#include <stdlib.h>
#include <strings.h>
#include <sys/time.h>

namespace synod {

__thread char t_time[64];
__thread time_t t_lastSecond;

Logger::LogLevel initLogLevel() {
  const char* env = ::getenv("SYNOD_LOG_LEVEL");
  Logger::LogLevel level = Logger::INFO;
  if (env) {
    Logger::parseLogLevel(env, level);
  }
  return level;
}

Logger::LogLevel g_logLevel = initLogLevel();

const char* LogLevelName[Logger::NUM_LOG_LEVELS] = {
    "TRACE ",
    "DEBUG ",
    "INFO  ",
    "WARN  ",
    "ERROR ",
    "FATAL ",
};

inline LogStream& operator<<(LogStream& s, const Logger::SourceFile& v) {
  s.write(v.data_, v.size_);
  return s;
}

void defaultOutput(const char* msg, int len) {
  size_t n = fwrite(msg, 1, len, stdout);
  (void)n;
}

void defaultFlush() { fflush(stdout); }

// sinks can be swapped while other threads are logging.
std::mutex g_sink_mutex;
Logger::FlushFunc g_flush = defaultFlush;
Logger::OutputFunc g_output = defaultOutput;

Logger::Impl::Impl(LogLevel level, const SourceFile& file, int line)
    : line_(line), level_(level), stream_(), basename_(file) {
  formatTime();
  stream_.write(LogLevelName[level], 6);
}

void Logger::Impl::formatTime() {
  struct timeval tv;
  gettimeofday(&tv, NULL);

  time_t seconds = tv.tv_sec;
  int microseconds = static_cast<int>(tv.tv_usec);

  if (seconds != t_lastSecond) {
    t_lastSecond = seconds;
    struct tm tm_time;
    ::gmtime_r(&seconds, &tm_time);

    int len = snprintf(t_time, sizeof(t_time), "%4d%02d%02d %02d:%02d:%02d",
                       tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
                       tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec);
    assert(len == 17);
    (void)len;
  }

  char ud[64];
  auto sz = snprintf(ud, sizeof(ud), ".%06dZ ", microseconds);
  stream_.write(t_time, 17);
  stream_.write(ud, sz);
}

void Logger::Impl::finish() {
  stream_.write(" - ", 3);
  stream_ << basename_;
  stream_ << ':' << line_ << '\n';
}

Logger::Logger(SourceFile file, int line) : impl_(INFO, file, line) {}

Logger::Logger(SourceFile file, int line, LogLevel level) : impl_(level, file, line) {}

Logger::~Logger() {
  impl_.finish();
  auto str = stream().str();

  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_output(str.data(), (int)str.length());
  if (impl_.level_ >= ERROR) {
    g_flush();
  }

  if (impl_.level_ == FATAL) {
    abort();
  }
}

void Logger::setLogLevel(Logger::LogLevel level) { g_logLevel = level; }

bool Logger::parseLogLevel(const std::string& name, Logger::LogLevel& level) {
  static const char* names[NUM_LOG_LEVELS] = {"trace", "debug", "info", "warn", "error", "fatal"};
  for (int i = 0; i < NUM_LOG_LEVELS; i++) {
    if (strcasecmp(name.c_str(), names[i]) == 0) {
      level = static_cast<LogLevel>(i);
      return true;
    }
  }
  return false;
}

void Logger::setOutput(OutputFunc out) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_output = std::move(out);
}

void Logger::setFlush(FlushFunc flush) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_flush = std::move(flush);
}

void Logger::resetOutput() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_output = defaultOutput;
}

void Logger::resetFlush() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  g_flush = defaultFlush;
}

}  // namespace synod

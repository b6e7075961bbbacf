#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

void Init(const char *logFile, const spdlog::level::level_enum level) {
  if (s_Logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  spdlog::sink_ptr consoleSink;
  if (logFile) {
    consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  } else {
    consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  if (logFile) {
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(fileSink);
  }

  s_Logger =
      std::make_shared<spdlog::logger>("FLAPGATE", sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(level);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logging initialized");
}

void Shutdown() {
  spdlog::shutdown();
  s_Logger.reset();
}

void SetLevel(const spdlog::level::level_enum level) {
  if (s_Logger) {
    s_Logger->set_level(level);
  }
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  // Library code may log before the host calls Init (e.g. a test that skips
  // it); fall back to a console-only logger instead of a null deref.
  if (!s_Logger) {
    Init(nullptr);
  }
  return s_Logger;
}

} // namespace Log

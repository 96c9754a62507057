#include "dynamap/base/log.hpp"

#include "dynamap/mapper_option.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <memory>
#include <mutex>
#include <string>

namespace dynamap {

static constexpr char kLoggerName[] = "dynamap_logger";
static constexpr char kLogFormat[] = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%l] %v";

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> logger = nullptr;
std::shared_ptr<spdlog::logger> origin_default_logger = spdlog::default_logger();

spdlog::level::level_enum LogLevelToSpdlogLevel(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return spdlog::level::debug;
  case LogLevel::kInfo:
    return spdlog::level::info;
  case LogLevel::kWarn:
    return spdlog::level::warn;
  case LogLevel::kError:
    return spdlog::level::err;
  }
  return spdlog::level::info;
}

} // namespace

void Log::Init(const MapperOption& option) {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (logger != nullptr) {
    return;
  }

  if (option.log_file_.empty()) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  } else {
    logger = spdlog::basic_logger_mt(kLoggerName, option.log_file_);
  }
  logger->set_pattern(kLogFormat);
  logger->flush_on(spdlog::level::warn);
  logger->set_level(LogLevelToSpdlogLevel(option.log_level_));

  spdlog::set_default_logger(logger);
  Log::Info("Logger initialized, level={}, file={}",
            spdlog::level::to_string_view(logger->level()),
            option.log_file_.empty() ? std::string("<stderr>") : option.log_file_);
}

void Log::Deinit() {
  std::lock_guard<std::mutex> lock(logger_mutex);
  if (logger == nullptr) {
    return;
  }

  Log::Info("Logger deinited");
  logger->flush();
  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(origin_default_logger);
  logger = nullptr;
}

void Log::DebugCheck(bool condition, const std::string& msg) {
  if (!condition) {
    spdlog::critical(msg);
    assert(false);
  }
}

void Log::Debug(const std::string& msg) {
  spdlog::debug(msg);
}

void Log::Info(const std::string& msg) {
  spdlog::info(msg);
}

void Log::Warn(const std::string& msg) {
  spdlog::warn(msg);
}

void Log::Error(const std::string& msg) {
  spdlog::error(msg);
}

} // namespace dynamap

#pragma once

#include <format>
#include <string>
#include <utility>

#ifdef DEBUG
#define DYNAMAP_DLOG(...) dynamap::Log::Debug(__VA_ARGS__);
#define DYNAMAP_DCHECK(...) dynamap::Log::DebugCheck(__VA_ARGS__);
#else
#define DYNAMAP_DLOG(...) (void)0;
#define DYNAMAP_DCHECK(...) (void)0;
#endif

namespace dynamap {

struct MapperOption;

class Log {
public:
  static void Init(const MapperOption& option);
  static void Deinit();

  static void DebugCheck(bool condition, const std::string& msg = "");

  static void Debug(const std::string& msg);

  static void Info(const std::string& msg);

  static void Warn(const std::string& msg);

  static void Error(const std::string& msg);

  template <typename... Args>
  static void DebugCheck(bool condition, std::format_string<Args...> fmt, Args&&... args) {
    DebugCheck(condition, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Debug(std::format_string<Args...> fmt, Args&&... args) {
    Debug(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Info(std::format_string<Args...> fmt, Args&&... args) {
    Info(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Warn(std::format_string<Args...> fmt, Args&&... args) {
    Warn(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void Error(std::format_string<Args...> fmt, Args&&... args) {
    Error(std::format(fmt, std::forward<Args>(args)...));
  }
};

} // namespace dynamap

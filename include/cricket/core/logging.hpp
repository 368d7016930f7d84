#pragma once
#include "cricket/core/config.hpp"

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <spdlog/common.h>
#include <string>
#include <string_view>
#include <vector>

namespace cricket::core {

// Inbound requests and route handlers.
inline constexpr std::string_view ServerLogger = "server";
// Provider, rankings, feed and X traffic.
inline constexpr std::string_view UpstreamLogger = "upstream";

inline constexpr std::size_t LogFileBytes = 10 * 1024 * 1024;
inline constexpr std::size_t LogFileCount = 3;
inline constexpr std::string_view LogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

// LOG_LEVEL is free text; anything spdlog does not know falls back to info.
inline spdlog::level::level_enum parseLevel(std::string_view Name) {
  auto Level = spdlog::level::from_str(std::string(Name));
  if (Level == spdlog::level::off && Name != "off") {
    return spdlog::level::info;
  }
  return Level;
}

// Stdout is shared by every logger. With LOG_DIR set each logger also gets
// its own rotating {LogDir}/{Name}.log.
inline std::vector<spdlog::sink_ptr>
sinksFor(std::string_view Name, const Config &Cfg) {
  static auto Console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  std::vector<spdlog::sink_ptr> Sinks{Console};
  if (!Cfg.LogDir) {
    return Sinks;
  }

  std::filesystem::path Dir{*Cfg.LogDir};
  std::filesystem::create_directories(Dir);
  Sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      (Dir / (std::string(Name) + ".log")).string(), LogFileBytes, LogFileCount
  ));
  return Sinks;
}

inline std::shared_ptr<spdlog::logger>
registerLogger(std::string_view Name, const Config &Cfg) {
  auto Sinks = sinksFor(Name, Cfg);
  auto Logger = std::make_shared<spdlog::logger>(
      std::string(Name), Sinks.begin(), Sinks.end()
  );
  Logger->set_level(parseLevel(Cfg.LogLevel));
  Logger->set_pattern(std::string(LogPattern));
  spdlog::register_logger(Logger);
  return Logger;
}

// Named logger, or the default one when setupLogging has not run (tests).
inline std::shared_ptr<spdlog::logger> logger(std::string_view Name) {
  auto Logger = spdlog::get(std::string(Name));
  return Logger ? Logger : spdlog::default_logger();
}

// Bare spdlog::info() and friends go to the server logger afterwards.
inline void setupLogging(const Config &Cfg) {
  spdlog::set_default_logger(registerLogger(ServerLogger, Cfg));
  registerLogger(UpstreamLogger, Cfg);

  spdlog::flush_on(spdlog::level::warn);
  spdlog::flush_every(std::chrono::seconds(1));
}

} // namespace cricket::core

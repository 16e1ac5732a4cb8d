#include "applog.hpp"

#include <cstdlib>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

std::filesystem::path defaultLogPath() {
  const char *state = std::getenv("XDG_STATE_HOME");
  if (state && *state)
    return std::filesystem::path(state) / "geoshell" / "geoshell.log";
  const char *home = std::getenv("HOME");
  std::filesystem::path base = home ? home : ".";
  return base / ".local" / "state" / "geoshell" / "geoshell.log";
}

bool initLogging(const std::filesystem::path &path, bool verbose) {
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;

  try {
    std::filesystem::create_directories(path.parent_path());
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), 5 * 1024 * 1024, 3);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    auto logger = std::make_shared<spdlog::logger>("geoshell", sink);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
  } catch (const std::exception &) {
    // No terminal output while the UI runs: fall back to a silent logger
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "geoshell", std::make_shared<spdlog::sinks::null_sink_mt>()));
    return false;
  }

  spdlog::info("geoshell logging to {} (level {})", path.string(),
               spdlog::level::to_string_view(level));
  return true;
}

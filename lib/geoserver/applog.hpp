/**
 * @file applog.hpp
 * @brief spdlog setup for a full-screen terminal application
 *
 * The terminal belongs to the UI, so log output goes to a rotating file
 * instead of stdout/stderr. All modules log through spdlog's default
 * logger once initLogging() ran.
 */

#ifndef APPLOG_HPP
#define APPLOG_HPP

#include <filesystem>

/** @brief `$XDG_STATE_HOME/geoshell/geoshell.log` (or ~/.local/state/...) */
std::filesystem::path defaultLogPath();

/**
 * @brief Installs a rotating file logger as spdlog's default logger
 *
 * @param path Log file, parent directories are created
 * @param verbose Lowers the level from info to debug
 * @return false if the file sink could not be created; logging then stays
 *         disabled rather than writing over the UI
 */
bool initLogging(const std::filesystem::path &path, bool verbose);

#endif // APPLOG_HPP

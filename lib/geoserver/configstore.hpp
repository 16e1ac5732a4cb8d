/**
 * @file configstore.hpp
 * @brief Persistent application settings (config.json)
 *
 * Stores the list of server connections, the last local directory, the
 * theme and the health poll interval as JSON under
 * `$XDG_CONFIG_HOME/geoshell/config.json` (or `~/.config/geoshell/`).
 *
 * @see AppConfig
 * @see ConfigStore
 */

#ifndef CONFIGSTORE_HPP
#define CONFIGSTORE_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "models.hpp"
#include "result.hpp"

/**
 * @struct AppConfig
 * @brief In-memory form of config.json
 */
struct AppConfig {
  static constexpr int DEFAULT_PING_INTERVAL = 60;
  static constexpr int MIN_PING_INTERVAL = 10;
  static constexpr int MAX_PING_INTERVAL = 600;

  std::vector<Connection> connections;
  std::string activeConnection;
  std::string lastLocalPath;
  std::string theme = "default";
  /** @brief Raw stored value; 0 or negative means "use the default" */
  int pingIntervalSecs = 0;

  /** @brief Effective poll interval in seconds */
  int pingInterval() const {
    return pingIntervalSecs > 0 ? pingIntervalSecs : DEFAULT_PING_INTERVAL;
  }

  /** @brief Stores @p secs clamped to [10, 600] */
  void setPingInterval(int secs);

  const Connection *findConnection(const std::string &id) const;

  /**
   * @brief Adds @p connection, assigning a fresh id if it has none
   * @return The id of the stored connection
   */
  std::string addConnection(Connection connection);

  /** @brief Replaces the connection with the same id */
  bool updateConnection(const Connection &connection);

  bool removeConnection(const std::string &id);
};

class ConfigStore {
private:
  std::filesystem::path m_path;
  // Serializes writers of the shared temporary file
  mutable std::mutex m_save_mutex;

public:
  explicit ConfigStore(std::filesystem::path path) : m_path(std::move(path)) {}

  /** @brief `$XDG_CONFIG_HOME/geoshell/config.json`, falling back to ~/.config */
  static std::filesystem::path defaultPath();

  const std::filesystem::path &path() const { return m_path; }

  /**
   * @brief Reads the configuration file
   *
   * A missing file is not an error: it yields the default configuration
   * with the home directory as last local path. A file that cannot be
   * parsed is.
   */
  Result<AppConfig> load() const;

  /**
   * @brief Writes the configuration atomically
   *
   * Restricts `config.json.tmp` to mode 0600 before any content reaches
   * it, then renames it over the real file so a crash never leaves a
   * truncated configuration behind. Concurrent calls are serialized.
   */
  Status save(const AppConfig &config) const;
};

/** @brief Generates a random connection id ("conn-3f9a1c0d") */
std::string generateConnectionId();

#endif // CONFIGSTORE_HPP

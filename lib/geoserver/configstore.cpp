#include "configstore.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

void to_json(json &j, const Connection &c) {
  j = json{{"id", c.id},
           {"name", c.name},
           {"url", c.url},
           {"username", c.username},
           {"password", c.password},
           {"is_active", c.is_active}};
}

void from_json(const json &j, Connection &c) {
  c.id = j.value("id", "");
  c.name = j.value("name", "");
  c.url = j.value("url", "");
  c.username = j.value("username", "");
  c.password = j.value("password", "");
  c.is_active = j.value("is_active", false);
}

namespace {

std::string homeDirectory() {
  const char *home = std::getenv("HOME");
  return home ? home : std::filesystem::current_path().string();
}

} // namespace

void AppConfig::setPingInterval(int secs) {
  pingIntervalSecs = std::max(MIN_PING_INTERVAL, std::min(secs, MAX_PING_INTERVAL));
}

const Connection *AppConfig::findConnection(const std::string &id) const {
  for (const auto &conn : connections) {
    if (conn.id == id)
      return &conn;
  }
  return nullptr;
}

std::string AppConfig::addConnection(Connection connection) {
  if (connection.id.empty())
    connection.id = generateConnectionId();
  connections.push_back(connection);
  return connection.id;
}

bool AppConfig::updateConnection(const Connection &connection) {
  for (auto &conn : connections) {
    if (conn.id == connection.id) {
      conn = connection;
      return true;
    }
  }
  return false;
}

bool AppConfig::removeConnection(const std::string &id) {
  auto it = std::remove_if(connections.begin(), connections.end(),
                           [&](const Connection &c) { return c.id == id; });
  if (it == connections.end())
    return false;
  connections.erase(it, connections.end());
  if (activeConnection == id)
    activeConnection.clear();
  return true;
}

std::filesystem::path ConfigStore::defaultPath() {
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  std::filesystem::path base =
      (xdg && *xdg) ? std::filesystem::path(xdg)
                    : std::filesystem::path(homeDirectory()) / ".config";
  return base / "geoshell" / "config.json";
}

Result<AppConfig> ConfigStore::load() const {
  AppConfig config;
  config.lastLocalPath = homeDirectory();

  std::error_code ec;
  if (!std::filesystem::exists(m_path, ec)) {
    spdlog::info("No configuration at {}, using defaults", m_path.string());
    return Result<AppConfig>::success(config);
  }

  std::ifstream in(m_path);
  if (!in) {
    return Result<AppConfig>::failure("failed to read config file " +
                                      m_path.string());
  }

  try {
    json j;
    in >> j;
    for (const auto &conn : j.value("connections", json::array()))
      config.connections.push_back(conn.get<Connection>());
    config.activeConnection = j.value("active_connection", "");
    config.lastLocalPath = j.value("last_local_path", config.lastLocalPath);
    config.theme = j.value("theme", config.theme);
    config.pingIntervalSecs = j.value("ping_interval_secs", 0);
  } catch (const json::exception &e) {
    spdlog::error("Failed to parse {}: {}", m_path.string(), e.what());
    return Result<AppConfig>::failure("failed to parse config file " +
                                      m_path.string() + ": " + e.what());
  }

  spdlog::info("Loaded {} connection(s) from {}", config.connections.size(),
               m_path.string());
  return Result<AppConfig>::success(config);
}

Status ConfigStore::save(const AppConfig &config) const {
  namespace fs = std::filesystem;
  std::lock_guard<std::mutex> lock(m_save_mutex);
  std::error_code ec;
  fs::create_directories(m_path.parent_path(), ec);
  if (ec) {
    spdlog::error("Failed to create {}: {}", m_path.parent_path().string(),
                  ec.message());
    return Status::failure("failed to create config directory: " +
                           ec.message());
  }

  json j;
  j["connections"] = config.connections;
  j["active_connection"] = config.activeConnection;
  j["last_local_path"] = config.lastLocalPath;
  j["theme"] = config.theme;
  if (config.pingIntervalSecs > 0)
    j["ping_interval_secs"] = config.pingIntervalSecs;

  fs::path tmp = m_path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      return Status::failure("failed to write config file " + tmp.string());

    // Credentials live in this file
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
      spdlog::error("Failed to restrict {}: {}", tmp.string(), ec.message());
      out.close();
      fs::remove(tmp, ec);
      return Status::failure("failed to restrict config file permissions");
    }

    out << j.dump(2);
    if (!out)
      return Status::failure("failed to write config file " + tmp.string());
  }

  fs::rename(tmp, m_path, ec);
  if (ec) {
    spdlog::error("Failed to replace {}: {}", m_path.string(), ec.message());
    fs::remove(tmp, ec);
    return Status::failure("failed to save config file: " + ec.message());
  }
  return Status::success();
}

std::string generateConnectionId() {
  static std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist;
  char buf[16];
  snprintf(buf, sizeof(buf), "%08x", dist(rng));
  return std::string("conn-") + buf;
}

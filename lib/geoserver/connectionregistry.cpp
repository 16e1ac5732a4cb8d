#include "connectionregistry.hpp"

#include <spdlog/spdlog.h>

namespace {

bool sameEndpoint(const Connection &a, const Connection &b) {
  return a.url == b.url && a.username == b.username &&
         a.password == b.password;
}

} // namespace

void ConnectionRegistry::setConnections(
    const std::vector<Connection> &connections) {
  std::map<std::string, std::shared_ptr<IResourceClient>> clients;

  for (const auto &conn : connections) {
    const Connection *old = find(conn.id);
    auto it = m_clients.find(conn.id);
    if (old && it != m_clients.end() && sameEndpoint(*old, conn)) {
      clients[conn.id] = it->second;
    } else {
      clients[conn.id] = m_factory(conn);
    }
  }

  m_connections = connections;
  m_clients = std::move(clients);
  spdlog::debug("Connection registry holds {} connection(s)",
                m_connections.size());
}

const Connection *ConnectionRegistry::find(const std::string &id) const {
  for (const auto &conn : m_connections) {
    if (conn.id == id)
      return &conn;
  }
  return nullptr;
}

std::shared_ptr<IResourceClient>
ConnectionRegistry::client(const std::string &id) const {
  auto it = m_clients.find(id);
  return it == m_clients.end() ? nullptr : it->second;
}

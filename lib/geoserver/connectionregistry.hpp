#ifndef CONNECTIONREGISTRY_HPP
#define CONNECTIONREGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "iresourceclient.hpp"
#include "models.hpp"

/**
 * @class ConnectionRegistry
 * @brief Maps connection ids to the client that talks to that server
 *
 * The registry owns one client per configured connection. Clients are
 * handed out as shared pointers so background tasks keep theirs alive
 * even if the connection list is edited while the task runs.
 */
class ConnectionRegistry {
public:
  using ClientFactory =
      std::function<std::shared_ptr<IResourceClient>(const Connection &)>;

private:
  ClientFactory m_factory;
  std::vector<Connection> m_connections;
  std::map<std::string, std::shared_ptr<IResourceClient>> m_clients;

public:
  explicit ConnectionRegistry(ClientFactory factory)
      : m_factory(std::move(factory)) {}

  /** @brief Replaces the membership; clients of unchanged connections are kept */
  void setConnections(const std::vector<Connection> &connections);

  const std::vector<Connection> &connections() const { return m_connections; }
  const Connection *find(const std::string &id) const;

  /** @brief Client for @p id, nullptr if the connection is unknown */
  std::shared_ptr<IResourceClient> client(const std::string &id) const;

  size_t size() const { return m_connections.size(); }
};

#endif // CONNECTIONREGISTRY_HPP

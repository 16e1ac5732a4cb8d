#include "controller.hpp"

#include <spdlog/spdlog.h>

#include "dialogs.hpp"
#include "utils.hpp"

namespace {

WizardSpec connectionForm(const Connection *existing) {
  auto field = [](std::string key, std::string label, std::string value,
                  bool required) {
    FieldSpec spec;
    spec.key = std::move(key);
    spec.label = std::move(label);
    spec.value = std::move(value);
    spec.required = required;
    return spec;
  };

  FieldSpec password =
      field("password", "Password", existing ? existing->password : "", false);
  password.kind = FieldKind::Secret;

  WizardSpec spec;
  spec.title = existing ? "Edit connection" : "Add connection";
  spec.steps.push_back(
      {"Server",
       {field("name", "Name", existing ? existing->name : "", true),
        field("url", "URL",
              existing ? existing->url : "http://localhost:8080/geoserver",
              true),
        field("username", "Username", existing ? existing->username : "admin",
              false),
        password}});
  return spec;
}

} // namespace

// ============================================================================
// HEALTH
// ============================================================================

std::vector<Effect> AppController::refreshHealth(bool manual) {
  auto effects =
      m_state.health.refresh(*m_world.registry, pingInterval(), manual);
  if (manual) {
    if (effects.empty())
      setStatus("A status refresh is already running");
    else
      setStatus("Refreshing server status");
  } else if (effects.empty() && m_state.health.refreshing()) {
    m_health_pending = true;
  }
  return effects;
}

std::vector<Effect>
AppController::onProbeFinished(const ProbeFinished &message) {
  return m_state.health.onProbeFinished(message);
}

std::vector<Effect>
AppController::onStatusesUpdated(const StatusesUpdated &message) {
  if (!m_state.health.onStatusesUpdated(message))
    return {};
  size_t online = 0;
  for (const auto &status : message.statuses) {
    if (status.online)
      ++online;
  }
  spdlog::debug("status refresh {}: {}/{} online", message.refreshId, online,
                message.statuses.size());
  if (!m_health_pending)
    return {};
  m_health_pending = false;
  return refreshHealth(false);
}

std::vector<Effect> AppController::onHealthTick(const HealthTick &message) {
  return m_state.health.onTick(message, *m_world.registry, pingInterval());
}

// ============================================================================
// CONNECTION LIST
// ============================================================================

std::vector<Effect>
AppController::openConnectionForm(const Connection *existing) {
  auto wizard = std::make_unique<WizardOverlay>(connectionForm(existing));
  const std::string id = existing ? existing->id : "";
  wizard->setOnConfirm([id](const FormValues &values) {
    const std::string url = trim(valueOf(values, "url"));
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)
      return ConfirmOutcome::reject("URL must start with http:// or https://");
    return ConfirmOutcome::accept(immediate(ConnectionSubmitted{id, values}));
  });
  return openOverlay(std::move(wizard));
}

std::vector<Effect> AppController::confirmRemoveConnection() {
  const auto &connections = m_world.config.connections;
  if (m_state.connectionRow >= connections.size())
    return {};
  const Connection &connection = connections[m_state.connectionRow];

  auto dialog = std::make_unique<ConfirmDialog>(
      "Remove connection", "Remove connection '" + connection.name +
                               "'?\nThe server itself is not changed.");
  const std::string id = connection.id;
  dialog->setOnConfirm([id](const FormValues &) {
    return ConfirmOutcome::accept(immediate(ConnectionRemoved{id}));
  });
  return openOverlay(std::move(dialog));
}

std::vector<Effect> AppController::testConnection() {
  const auto &connections = m_world.config.connections;
  if (m_state.connectionRow >= connections.size())
    return {};
  const Connection &connection = connections[m_state.connectionRow];
  auto client = m_world.registry->client(connection.id);
  if (!client)
    return {};

  setStatus("Testing " + connection.name + "...");
  const std::string id = connection.id;
  return {makeEffect(
      EffectKind::Load, "test " + connection.name,
      [client, id](EffectContext &) -> Message {
        return ConnectionTested{id, client->fetchStatus()};
      },
      [id](const std::string &error) -> Message {
        return ConnectionTested{id, Result<ServerStatus>::failure(error)};
      })};
}

std::vector<Effect>
AppController::onConnectionSubmitted(const ConnectionSubmitted &message) {
  Connection connection;
  if (!message.id.empty()) {
    const Connection *existing = m_world.config.findConnection(message.id);
    if (!existing) {
      setStatus("Connection no longer exists", true);
      return {};
    }
    connection = *existing;
  }
  connection.name = trim(valueOf(message.values, "name"));
  connection.url = trim(valueOf(message.values, "url"));
  connection.username = trim(valueOf(message.values, "username"));
  connection.password = valueOf(message.values, "password");

  if (message.id.empty())
    m_world.config.addConnection(connection);
  else
    m_world.config.updateConnection(connection);

  setStatus("Connection '" + connection.name + "' saved");
  return connectionsChanged();
}

std::vector<Effect>
AppController::onConnectionRemoved(const ConnectionRemoved &message) {
  const Connection *connection = m_world.config.findConnection(message.id);
  if (!connection)
    return {};
  const std::string name = connection->name;
  m_world.config.removeConnection(message.id);
  setStatus("Connection '" + name + "' removed");
  return connectionsChanged();
}

std::vector<Effect>
AppController::onConnectionTested(const ConnectionTested &message) {
  const Connection *connection = m_world.config.findConnection(message.id);
  const std::string name = connection ? connection->name : message.id;
  if (!message.status) {
    setStatus("Connection '" + name + "' failed: " + message.status.error(),
              true);
    return {};
  }
  const ServerStatus &status = message.status.value();
  setStatus("Connection '" + name + "' OK: GeoServer " + status.version +
            ", " + std::to_string(status.responseTimeMs) + " ms");
  return {};
}

std::vector<Effect> AppController::connectionsChanged() {
  m_world.registry->setConnections(m_world.config.connections);

  const size_t count = m_world.config.connections.size();
  if (m_state.connectionRow >= count)
    m_state.connectionRow = count > 0 ? count - 1 : 0;
  if (m_state.dashboardRow >= count)
    m_state.dashboardRow = count > 0 ? count - 1 : 0;

  auto effects = refreshTree(std::nullopt, m_state.tree.snapshot());
  append(effects, persistConfig());
  append(effects, refreshHealth(false));
  return effects;
}

#include "healthpoller.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

ServerStatus offlineStatus(const Connection &connection,
                           const std::string &error) {
  ServerStatus status;
  status.connectionId = connection.id;
  status.connectionName = connection.name;
  status.url = connection.url;
  status.online = false;
  status.error = error;
  return status;
}

Effect probeEffect(std::shared_ptr<IResourceClient> client,
                   const Connection &connection, uint64_t refresh_id,
                   size_t index, std::chrono::milliseconds delay) {
  return makeEffect(
      EffectKind::Probe, "probe " + connection.name,
      [client, connection, refresh_id, index, delay](EffectContext &context)
          -> Message {
        if (!context.sleepFor(delay))
          return ProbeFinished{refresh_id, index,
                               offlineStatus(connection, "cancelled")};
        if (!client)
          return ProbeFinished{
              refresh_id, index,
              offlineStatus(connection, "connection is not configured")};

        auto result = client->fetchStatus();
        if (!result)
          return ProbeFinished{refresh_id, index,
                               offlineStatus(connection, result.error())};

        ServerStatus status = result.value();
        status.connectionId = connection.id;
        status.connectionName = connection.name;
        status.url = connection.url;
        status.online = true;
        return ProbeFinished{refresh_id, index, status};
      },
      [connection, refresh_id, index](const std::string &error) -> Message {
        return ProbeFinished{refresh_id, index,
                             offlineStatus(connection, error)};
      });
}

} // namespace

std::chrono::milliseconds staggerDelay(std::chrono::milliseconds interval,
                                       size_t count) {
  if (count == 0)
    return std::chrono::milliseconds(0);
  double spread = static_cast<double>(interval.count()) * 0.5 /
                  static_cast<double>(count);
  spread = std::min(2000.0, std::max(100.0, spread));
  return std::chrono::milliseconds(static_cast<int64_t>(spread));
}

std::vector<Effect> HealthPoller::refresh(const ConnectionRegistry &registry,
                                          std::chrono::milliseconds interval,
                                          bool manual) {
  if (m_inflight) {
    spdlog::debug("health refresh {} still running, skipped",
                  m_inflight->refreshId);
    return {};
  }

  const auto &connections = registry.connections();
  InFlight inflight;
  inflight.refreshId = m_next_refresh++;
  inflight.results.resize(connections.size());
  m_inflight = inflight;
  if (manual)
    m_loading = true;

  if (connections.empty())
    return {immediate(StatusesUpdated{inflight.refreshId, {}})};

  const auto stagger = staggerDelay(interval, connections.size());
  spdlog::debug("health refresh {}: {} probes, {} ms apart",
                inflight.refreshId, connections.size(), stagger.count());

  std::vector<Effect> effects;
  for (size_t i = 0; i < connections.size(); ++i) {
    const auto &connection = connections[i];
    effects.push_back(probeEffect(registry.client(connection.id), connection,
                                  inflight.refreshId, i,
                                  stagger * static_cast<int64_t>(i)));
  }
  return effects;
}

std::vector<Effect> HealthPoller::onProbeFinished(const ProbeFinished &message) {
  if (!m_inflight || m_inflight->refreshId != message.refreshId)
    return {};
  auto &results = m_inflight->results;
  if (message.index >= results.size() || results[message.index])
    return {};

  results[message.index] = message.status;
  if (++m_inflight->received < results.size())
    return {};

  StatusesUpdated update;
  update.refreshId = m_inflight->refreshId;
  for (const auto &result : results)
    update.statuses.push_back(*result);
  return {immediate(update)};
}

bool HealthPoller::onStatusesUpdated(const StatusesUpdated &message) {
  if (!m_inflight || m_inflight->refreshId != message.refreshId)
    return false;

  m_statuses = message.statuses;
  std::map<std::string, PingHistory> history;
  for (const auto &status : m_statuses) {
    auto it = m_history.find(status.connectionId);
    PingHistory samples = it != m_history.end()
                              ? it->second
                              : PingHistory(m_history_capacity);
    samples.add(static_cast<double>(status.responseTimeMs));
    history.emplace(status.connectionId, samples);
  }
  m_history = std::move(history);

  m_inflight.reset();
  m_loading = false;
  m_last_refresh = std::chrono::system_clock::now();
  return true;
}

Effect HealthPoller::startTimer(std::chrono::milliseconds interval) {
  return timerEffect(interval, ++m_timer_generation);
}

Effect HealthPoller::timerEffect(std::chrono::milliseconds interval,
                                 uint64_t generation) const {
  return makeEffect(EffectKind::Timer, "health timer",
                    [interval, generation](EffectContext &context) -> Message {
                      if (!context.sleepFor(interval))
                        return Noop{};
                      return HealthTick{generation};
                    });
}

std::vector<Effect> HealthPoller::onTick(const HealthTick &message,
                                         const ConnectionRegistry &registry,
                                         std::chrono::milliseconds interval) {
  if (message.generation != m_timer_generation)
    return {};
  auto effects = refresh(registry, interval, false);
  effects.push_back(timerEffect(interval, m_timer_generation));
  return effects;
}

const ServerStatus *
HealthPoller::status(const std::string &connection_id) const {
  for (const auto &status : m_statuses) {
    if (status.connectionId == connection_id)
      return &status;
  }
  return nullptr;
}

const PingHistory *
HealthPoller::history(const std::string &connection_id) const {
  auto it = m_history.find(connection_id);
  return it == m_history.end() ? nullptr : &it->second;
}

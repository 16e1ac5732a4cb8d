/**
 * @file healthpoller.hpp
 * @brief Periodic status probes of every configured server
 *
 * A refresh probes all connections concurrently. Probe i starts after
 * i * stagger milliseconds so that the requests do not all hit the network
 * at once. The individual results are collected here and published as a
 * single StatusesUpdated once every probe has reported, success or not.
 */

#ifndef HEALTHPOLLER_HPP
#define HEALTHPOLLER_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "connectionregistry.hpp"
#include "effect.hpp"
#include "pinghistory.hpp"

/**
 * @brief Delay between the starts of consecutive probes
 *
 * Half the refresh interval spread over all probes, at least 100 ms and at
 * most 2 s. Fractional milliseconds are truncated.
 */
std::chrono::milliseconds staggerDelay(std::chrono::milliseconds interval,
                                       size_t count);

class HealthPoller {
private:
  struct InFlight {
    uint64_t refreshId = 0;
    std::vector<std::optional<ServerStatus>> results;
    size_t received = 0;
  };

  std::vector<ServerStatus> m_statuses;
  std::map<std::string, PingHistory> m_history;
  std::optional<InFlight> m_inflight;
  bool m_loading = false;
  uint64_t m_next_refresh = 1;
  uint64_t m_timer_generation = 0;
  size_t m_history_capacity;
  std::chrono::system_clock::time_point m_last_refresh{};

  Effect timerEffect(std::chrono::milliseconds interval,
                     uint64_t generation) const;

public:
  explicit HealthPoller(size_t history_capacity = PingHistory::kDefaultCapacity)
      : m_history_capacity(history_capacity) {}

  /**
   * @brief Starts probing every connection of @p registry
   *
   * @param manual Operator-requested refreshes show the loading state;
   *               timer-driven ones do not
   * @return probe effects, or nothing when a refresh is already running
   */
  std::vector<Effect> refresh(const ConnectionRegistry &registry,
                              std::chrono::milliseconds interval, bool manual);

  std::vector<Effect> onProbeFinished(const ProbeFinished &message);

  /** @brief Publishes a completed refresh; stale refresh ids are ignored */
  bool onStatusesUpdated(const StatusesUpdated &message);

  /**
   * @brief (Re)starts the periodic timer
   *
   * Ticks of earlier timers are ignored from now on.
   */
  Effect startTimer(std::chrono::milliseconds interval);

  /** @brief Timer fired: refresh in the background and schedule the next tick */
  std::vector<Effect> onTick(const HealthTick &message,
                             const ConnectionRegistry &registry,
                             std::chrono::milliseconds interval);

  bool loading() const { return m_loading; }
  bool refreshing() const { return m_inflight.has_value(); }
  const std::vector<ServerStatus> &statuses() const { return m_statuses; }
  const ServerStatus *status(const std::string &connection_id) const;
  const PingHistory *history(const std::string &connection_id) const;
  std::chrono::system_clock::time_point lastRefresh() const {
    return m_last_refresh;
  }
};

#endif // HEALTHPOLLER_HPP

#ifndef PINGHISTORY_HPP
#define PINGHISTORY_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <vector>

/**
 * @class PingHistory
 * @brief Most recent response times of one server, oldest first
 *
 * Bounded ring buffer: once full, adding a sample drops the oldest one.
 */
class PingHistory {
public:
  static constexpr size_t kDefaultCapacity = 30;

private:
  std::deque<double> m_samples;
  size_t m_capacity;
  std::chrono::system_clock::time_point m_last_updated{};

public:
  explicit PingHistory(size_t capacity = kDefaultCapacity)
      : m_capacity(capacity == 0 ? 1 : capacity) {}

  void add(double response_ms) {
    m_samples.push_back(response_ms);
    while (m_samples.size() > m_capacity)
      m_samples.pop_front();
    m_last_updated = std::chrono::system_clock::now();
  }

  size_t size() const { return m_samples.size(); }
  size_t capacity() const { return m_capacity; }
  bool empty() const { return m_samples.empty(); }
  double latest() const { return m_samples.empty() ? 0.0 : m_samples.back(); }

  std::vector<double> samples() const {
    return std::vector<double>(m_samples.begin(), m_samples.end());
  }

  std::chrono::system_clock::time_point lastUpdated() const {
    return m_last_updated;
  }
};

#endif // PINGHISTORY_HPP

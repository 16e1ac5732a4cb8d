/**
 * @file overlaystack.hpp
 * @brief Single slot holding the active overlay
 *
 * Despite the name at most one overlay is ever shown. Opening a new one
 * replaces the current one without running its cancel callback. A
 * confirmed or cancelled overlay first plays its closing transition; the
 * command produced by its callback is held as the pending command and
 * dispatched only when the slot is released.
 */

#ifndef OVERLAYSTACK_HPP
#define OVERLAYSTACK_HPP

#include <memory>
#include <optional>
#include <vector>

#include "effect.hpp"
#include "overlay.hpp"

class OverlayStack {
public:
  static constexpr std::chrono::milliseconds kFrameDelay{40};

private:
  std::unique_ptr<Overlay> m_active;
  std::optional<Effect> m_pending;

  Effect closeTick(uint64_t overlay_id) const;

public:
  /**
   * @brief Shows @p overlay, replacing any active one
   *
   * If the replaced overlay was already closing, its pending command is
   * dispatched right away.
   */
  std::vector<Effect> open(std::unique_ptr<Overlay> overlay);

  /** @brief Routes a key to the active overlay; input never passes through */
  std::vector<Effect> handleKey(const ftxui::Event &event);

  std::vector<Effect> onTick(const OverlayTick &message);

  Overlay *active() const { return m_active.get(); }
  bool empty() const { return !m_active; }
  bool hasPending() const { return m_pending.has_value(); }

  /** @brief The active overlay if it has @p id and type T */
  template <typename T> T *activeAs(uint64_t id) const {
    if (!m_active || m_active->id() != id)
      return nullptr;
    return dynamic_cast<T *>(m_active.get());
  }
};

#endif // OVERLAYSTACK_HPP

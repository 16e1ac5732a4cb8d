#include "overlaystack.hpp"

#include <spdlog/spdlog.h>

Effect OverlayStack::closeTick(uint64_t overlay_id) const {
  return makeEffect(EffectKind::Animation, "overlay transition",
                    [overlay_id](EffectContext &context) -> Message {
                      context.sleepFor(kFrameDelay);
                      return OverlayTick{overlay_id};
                    });
}

std::vector<Effect> OverlayStack::open(std::unique_ptr<Overlay> overlay) {
  std::vector<Effect> effects;
  if (m_active) {
    spdlog::debug("overlay '{}' replaced by '{}'", m_active->title(),
                  overlay->title());
    if (m_active->isClosing() && m_pending) {
      effects.push_back(std::move(*m_pending));
      m_pending.reset();
    }
  }
  m_active = std::move(overlay);
  return effects;
}

std::vector<Effect> OverlayStack::handleKey(const ftxui::Event &event) {
  if (!m_active || m_active->isClosing())
    return {};

  switch (m_active->handleKey(event)) {
  case Overlay::KeyResult::Confirm: {
    std::optional<Effect> command;
    if (m_active->onConfirm()) {
      ConfirmOutcome outcome = m_active->onConfirm()(m_active->values());
      if (!outcome.error.empty()) {
        m_active->setError(outcome.error);
        return {};
      }
      command = std::move(outcome.command);
    }
    m_pending = std::move(command);
    m_active->beginClose();
    return {closeTick(m_active->id())};
  }
  case Overlay::KeyResult::Cancel:
    m_pending.reset();
    if (m_active->onCancel())
      m_pending = m_active->onCancel()();
    m_active->beginClose();
    return {closeTick(m_active->id())};
  case Overlay::KeyResult::Consumed:
  case Overlay::KeyResult::Ignored:
    break;
  }
  return {};
}

std::vector<Effect> OverlayStack::onTick(const OverlayTick &message) {
  if (!m_active || m_active->id() != message.overlayId ||
      !m_active->isClosing())
    return {};

  m_active->advance();
  if (m_active->isVisible())
    return {closeTick(m_active->id())};

  m_active.reset();
  if (!m_pending)
    return {};
  std::vector<Effect> effects;
  effects.push_back(std::move(*m_pending));
  m_pending.reset();
  return effects;
}

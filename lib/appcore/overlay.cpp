#include "overlay.hpp"

using namespace ftxui;

namespace {
uint64_t nextOverlayId() {
  static uint64_t next = 1;
  return next++;
}
} // namespace

Overlay::Overlay(OverlayKind kind, std::string title)
    : m_id(nextOverlayId()), m_kind(kind), m_title(std::move(title)) {}

void Overlay::beginClose() {
  if (m_phase != Phase::Open)
    return;
  m_phase = Phase::Closing;
  m_close_frames = kCloseFrames;
}

void Overlay::advance() {
  if (m_phase != Phase::Closing)
    return;
  if (--m_close_frames <= 0)
    m_phase = Phase::Closed;
}

Element Overlay::frame(Elements body, Element footer) const {
  Elements content;
  content.push_back(text(m_title) | bold | color(Color::Cyan) | hcenter);
  content.push_back(separator());
  for (auto &element : body)
    content.push_back(std::move(element));
  if (!m_error.empty()) {
    content.push_back(separator());
    content.push_back(text(m_error) | color(Color::Red) | bold);
  }
  content.push_back(separator());
  content.push_back(std::move(footer) | hcenter);

  Element box = vbox(std::move(content)) | size(WIDTH, GREATER_THAN, 50) |
                border | clear_under | center;
  if (isClosing())
    box = box | dim;
  return box;
}

/**
 * @file overlay.hpp
 * @brief Base class of modal dialogs shown above the screens
 *
 * An overlay decides what its keys mean (confirm, cancel, edit) but not
 * what happens afterwards: its owner installs callbacks that turn the
 * answer into an Effect. OverlayStack dispatches that effect once the
 * overlay has finished closing.
 */

#ifndef OVERLAY_HPP
#define OVERLAY_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

#include "effect.hpp"
#include "formtypes.hpp"

enum class OverlayKind {
  Confirm,
  Input,
  Wizard,
  Progress,
  Info,
  Search,
  Preview
};

/**
 * @struct ConfirmOutcome
 * @brief What an on-confirm callback decided
 *
 * A non-empty error keeps the overlay open and shows the error in it.
 */
struct ConfirmOutcome {
  std::optional<Effect> command;
  std::string error;

  static ConfirmOutcome accept(std::optional<Effect> command = std::nullopt) {
    return {std::move(command), ""};
  }
  static ConfirmOutcome reject(std::string error) {
    return {std::nullopt, std::move(error)};
  }
};

using ConfirmHandler = std::function<ConfirmOutcome(const FormValues &)>;
using CancelHandler = std::function<std::optional<Effect>()>;

class Overlay {
public:
  enum class Phase { Open, Closing, Closed };
  enum class KeyResult { Ignored, Consumed, Confirm, Cancel };

  /** @brief Frames of the closing transition */
  static constexpr int kCloseFrames = 3;

private:
  uint64_t m_id;
  OverlayKind m_kind;
  std::string m_title;
  Phase m_phase = Phase::Open;
  int m_close_frames = 0;
  std::string m_error;
  ConfirmHandler m_on_confirm;
  CancelHandler m_on_cancel;

protected:
  /** @brief Border, title and error line shared by all overlays */
  ftxui::Element frame(ftxui::Elements body, ftxui::Element footer) const;

public:
  Overlay(OverlayKind kind, std::string title);
  virtual ~Overlay() = default;

  Overlay(const Overlay &) = delete;
  Overlay &operator=(const Overlay &) = delete;

  uint64_t id() const { return m_id; }
  OverlayKind kind() const { return m_kind; }
  const std::string &title() const { return m_title; }

  Phase phase() const { return m_phase; }
  bool isVisible() const { return m_phase != Phase::Closed; }
  bool isClosing() const { return m_phase == Phase::Closing; }
  void beginClose();
  /** @brief Advances the closing transition by one frame */
  void advance();

  void setError(std::string error) { m_error = std::move(error); }
  const std::string &error() const { return m_error; }

  void setOnConfirm(ConfirmHandler handler) {
    m_on_confirm = std::move(handler);
  }
  void setOnCancel(CancelHandler handler) { m_on_cancel = std::move(handler); }
  const ConfirmHandler &onConfirm() const { return m_on_confirm; }
  const CancelHandler &onCancel() const { return m_on_cancel; }

  virtual KeyResult handleKey(const ftxui::Event &event) = 0;
  /** @brief Answer handed to the on-confirm callback */
  virtual FormValues values() const { return {}; }
  virtual ftxui::Element render() const = 0;
};

#endif // OVERLAY_HPP

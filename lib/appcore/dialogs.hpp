/**
 * @file dialogs.hpp
 * @brief Concrete overlays
 */

#ifndef DIALOGS_HPP
#define DIALOGS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "formtypes.hpp"
#include "message.hpp"
#include "overlay.hpp"

/**
 * @class ConfirmDialog
 * @brief Yes/no question; y or Enter confirms, n or Esc cancels
 */
class ConfirmDialog : public Overlay {
private:
  std::string m_message;

public:
  ConfirmDialog(std::string title, std::string message)
      : Overlay(OverlayKind::Confirm, std::move(title)),
        m_message(std::move(message)) {}

  const std::string &message() const { return m_message; }
  KeyResult handleKey(const ftxui::Event &event) override;
  ftxui::Element render() const override;
};

/**
 * @class InputDialog
 * @brief One line of text; the answer is values()["value"]
 */
class InputDialog : public Overlay {
private:
  std::string m_prompt;
  std::string m_value;

public:
  InputDialog(std::string title, std::string prompt, std::string initial = "")
      : Overlay(OverlayKind::Input, std::move(title)),
        m_prompt(std::move(prompt)), m_value(std::move(initial)) {}

  const std::string &value() const { return m_value; }
  KeyResult handleKey(const ftxui::Event &event) override;
  FormValues values() const override { return {{"value", m_value}}; }
  ftxui::Element render() const override;
};

/**
 * @class WizardOverlay
 * @brief Multi-step form built from a WizardSpec
 *
 * Tab and the arrow keys move between fields, Enter validates the required
 * fields of the current step and moves on (confirming on the last step),
 * Esc goes one step back or cancels on the first step.
 */
class WizardOverlay : public Overlay {
private:
  WizardSpec m_spec;
  size_t m_step = 0;
  size_t m_field = 0;
  size_t m_option = 0;

  std::vector<FieldSpec *> visibleFields();
  std::vector<const FieldSpec *> visibleFields() const;
  bool isShown(const FieldSpec &field) const;
  ftxui::Element renderField(const FieldSpec &field, bool focused) const;

public:
  explicit WizardOverlay(WizardSpec spec);

  size_t step() const { return m_step; }
  size_t stepCount() const { return m_spec.steps.size(); }
  /** @brief Sets a field directly, as typing into it would */
  bool setValue(const std::string &key, const std::string &value);
  std::string value(const std::string &key) const;

  KeyResult handleKey(const ftxui::Event &event) override;
  FormValues values() const override;
  ftxui::Element render() const override;
};

/**
 * @class ProgressOverlay
 * @brief Progress of an upload batch, dismissable once finished
 */
class ProgressOverlay : public Overlay {
private:
  uint64_t m_batch_id;
  size_t m_index = 0;
  size_t m_total;
  std::string m_file;
  bool m_done = false;
  bool m_success = false;
  std::vector<std::string> m_report;

public:
  ProgressOverlay(std::string title, uint64_t batch_id, size_t total)
      : Overlay(OverlayKind::Progress, std::move(title)), m_batch_id(batch_id),
        m_total(total) {}

  uint64_t batchId() const { return m_batch_id; }
  size_t index() const { return m_index; }
  bool done() const { return m_done; }

  void update(const UploadProgress &progress);
  void finish(bool success, std::vector<std::string> report);

  KeyResult handleKey(const ftxui::Event &event) override;
  ftxui::Element render() const override;
};

/**
 * @class InfoOverlay
 * @brief Scrollable read-only text
 */
class InfoOverlay : public Overlay {
private:
  std::vector<std::string> m_lines;
  size_t m_offset = 0;

public:
  InfoOverlay(std::string title, std::vector<std::string> lines)
      : Overlay(OverlayKind::Info, std::move(title)),
        m_lines(std::move(lines)) {}

  const std::vector<std::string> &lines() const { return m_lines; }
  KeyResult handleKey(const ftxui::Event &event) override;
  ftxui::Element render() const override;
};

/**
 * @class PreviewOverlay
 * @brief Read-only text that is loaded after the overlay opened
 */
class PreviewOverlay : public Overlay {
private:
  bool m_loading = true;
  std::vector<std::string> m_lines;
  size_t m_offset = 0;

public:
  explicit PreviewOverlay(std::string title)
      : Overlay(OverlayKind::Preview, std::move(title)) {}

  bool loading() const { return m_loading; }
  const std::vector<std::string> &lines() const { return m_lines; }
  void setContent(std::vector<std::string> lines);
  void setFailed(const std::string &error);

  KeyResult handleKey(const ftxui::Event &event) override;
  ftxui::Element render() const override;
};

struct SearchCandidate {
  uint64_t nodeId = 0;
  /** @brief Matched against the query */
  std::string name;
  /** @brief Shown in the result list only */
  std::string path;
  std::string kind;
};

/**
 * @class SearchOverlay
 * @brief Filters loaded tree nodes by a case-insensitive substring of
 *        their name
 *
 * The chosen node id is values()["node_id"].
 */
class SearchOverlay : public Overlay {
public:
  static constexpr size_t kMaxShown = 12;

private:
  std::vector<SearchCandidate> m_candidates;
  std::string m_query;
  size_t m_selected = 0;

public:
  explicit SearchOverlay(std::vector<SearchCandidate> candidates)
      : Overlay(OverlayKind::Search, "Search"),
        m_candidates(std::move(candidates)) {}

  const std::string &query() const { return m_query; }
  std::vector<const SearchCandidate *> matches() const;

  KeyResult handleKey(const ftxui::Event &event) override;
  FormValues values() const override;
  ftxui::Element render() const override;
};

#endif // DIALOGS_HPP

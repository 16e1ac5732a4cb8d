#include "dialogs.hpp"

#include <algorithm>
#include <sstream>

#include "utils.hpp"

using namespace ftxui;

namespace {

const std::vector<std::string> kSpinner = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                           "⠴", "⠦", "⠧", "⠇", "⠏"};
constexpr size_t kVisibleLines = 16;

Element keyHint(std::vector<std::pair<std::string, std::string>> hints) {
  Elements parts;
  for (size_t i = 0; i < hints.size(); ++i) {
    if (i > 0)
      parts.push_back(text("  "));
    parts.push_back(text(hints[i].first) | bold | color(Color::Yellow));
    parts.push_back(text(" " + hints[i].second) | color(Color::GrayLight));
  }
  return hbox(std::move(parts));
}

Elements paragraph(const std::string &message) {
  Elements lines;
  std::istringstream in(message);
  std::string line;
  while (std::getline(in, line))
    lines.push_back(text(line));
  return lines;
}

Elements scrolled(const std::vector<std::string> &lines, size_t offset) {
  Elements out;
  const size_t end = std::min(lines.size(), offset + kVisibleLines);
  for (size_t i = offset; i < end; ++i)
    out.push_back(text(lines[i]));
  if (lines.size() > kVisibleLines)
    out.push_back(text(std::to_string(offset + 1) + "-" + std::to_string(end) +
                       " of " + std::to_string(lines.size())) |
                  color(Color::GrayLight) | align_right);
  return out;
}

Overlay::KeyResult scrollKey(const Event &event, size_t &offset,
                             size_t line_count) {
  const size_t max_offset =
      line_count > kVisibleLines ? line_count - kVisibleLines : 0;
  if (event == Event::ArrowDown || event == Event::Character('j'))
    offset = std::min(offset + 1, max_offset);
  else if (event == Event::ArrowUp || event == Event::Character('k'))
    offset = offset > 0 ? offset - 1 : 0;
  else if (event == Event::PageDown)
    offset = std::min(offset + kVisibleLines, max_offset);
  else if (event == Event::PageUp)
    offset = offset > kVisibleLines ? offset - kVisibleLines : 0;
  return Overlay::KeyResult::Consumed;
}

bool isCloseKey(const Event &event) {
  return event == Event::Return || event == Event::Escape ||
         event == Event::Character('q');
}

/** @brief Printable text typed into a field, empty for control keys */
std::string typed(const Event &event) {
  if (!event.is_character())
    return "";
  return event.character();
}

void eraseLast(std::string &value) {
  // drop the whole trailing UTF-8 sequence
  while (!value.empty()) {
    const unsigned char c = static_cast<unsigned char>(value.back());
    value.pop_back();
    if ((c & 0xC0) != 0x80)
      break;
  }
}

} // namespace

// ConfirmDialog

Overlay::KeyResult ConfirmDialog::handleKey(const Event &event) {
  if (event == Event::Character('y') || event == Event::Character('Y') ||
      event == Event::Return)
    return KeyResult::Confirm;
  if (event == Event::Character('n') || event == Event::Character('N') ||
      event == Event::Escape)
    return KeyResult::Cancel;
  return KeyResult::Consumed;
}

Element ConfirmDialog::render() const {
  return frame(paragraph(m_message),
               keyHint({{"y", "confirm"}, {"n/Esc", "cancel"}}));
}

// InputDialog

Overlay::KeyResult InputDialog::handleKey(const Event &event) {
  if (event == Event::Return)
    return KeyResult::Confirm;
  if (event == Event::Escape)
    return KeyResult::Cancel;
  if (event == Event::Backspace) {
    eraseLast(m_value);
    return KeyResult::Consumed;
  }
  m_value += typed(event);
  return KeyResult::Consumed;
}

Element InputDialog::render() const {
  Elements body;
  body.push_back(text(m_prompt));
  body.push_back(hbox({text("> ") | color(Color::Green), text(m_value),
                       text("█") | blink}) |
                 border);
  return frame(std::move(body),
               keyHint({{"Enter", "accept"}, {"Esc", "cancel"}}));
}

// WizardOverlay

WizardOverlay::WizardOverlay(WizardSpec spec)
    : Overlay(OverlayKind::Wizard, spec.title), m_spec(std::move(spec)) {}

bool WizardOverlay::isShown(const FieldSpec &field) const {
  if (field.showIf.first.empty())
    return true;
  const std::string current = value(field.showIf.first);
  const auto &allowed = field.showIf.second;
  return std::find(allowed.begin(), allowed.end(), current) != allowed.end();
}

std::vector<FieldSpec *> WizardOverlay::visibleFields() {
  std::vector<FieldSpec *> fields;
  if (m_step >= m_spec.steps.size())
    return fields;
  for (auto &field : m_spec.steps[m_step].fields) {
    if (isShown(field))
      fields.push_back(&field);
  }
  return fields;
}

std::vector<const FieldSpec *> WizardOverlay::visibleFields() const {
  std::vector<const FieldSpec *> fields;
  if (m_step >= m_spec.steps.size())
    return fields;
  for (const auto &field : m_spec.steps[m_step].fields) {
    if (isShown(field))
      fields.push_back(&field);
  }
  return fields;
}

bool WizardOverlay::setValue(const std::string &key, const std::string &value) {
  for (auto &step : m_spec.steps) {
    for (auto &field : step.fields) {
      if (field.key == key) {
        field.value = value;
        return true;
      }
    }
  }
  return false;
}

std::string WizardOverlay::value(const std::string &key) const {
  for (const auto &step : m_spec.steps) {
    for (const auto &field : step.fields) {
      if (field.key == key)
        return field.value;
    }
  }
  return "";
}

FormValues WizardOverlay::values() const {
  FormValues out;
  for (const auto &step : m_spec.steps) {
    for (const auto &field : step.fields)
      out[field.key] = field.value;
  }
  return out;
}

Overlay::KeyResult WizardOverlay::handleKey(const Event &event) {
  auto fields = visibleFields();

  if (event == Event::Escape) {
    if (m_step == 0)
      return KeyResult::Cancel;
    --m_step;
    m_field = 0;
    m_option = 0;
    setError("");
    return KeyResult::Consumed;
  }

  if (event == Event::Return) {
    for (const FieldSpec *field : fields) {
      if (field->required && trim(field->value).empty()) {
        setError(field->label + " is required");
        return KeyResult::Consumed;
      }
    }
    setError("");
    if (m_step + 1 < m_spec.steps.size()) {
      ++m_step;
      m_field = 0;
      m_option = 0;
      return KeyResult::Consumed;
    }
    return KeyResult::Confirm;
  }

  if (fields.empty())
    return KeyResult::Consumed;
  m_field = std::min(m_field, fields.size() - 1);

  if (event == Event::Tab || event == Event::ArrowDown) {
    m_field = (m_field + 1) % fields.size();
    m_option = 0;
    return KeyResult::Consumed;
  }
  if (event == Event::TabReverse || event == Event::ArrowUp) {
    m_field = (m_field + fields.size() - 1) % fields.size();
    m_option = 0;
    return KeyResult::Consumed;
  }

  FieldSpec &field = *fields[m_field];
  switch (field.kind) {
  case FieldKind::Text:
  case FieldKind::Secret:
    if (event == Event::Backspace)
      eraseLast(field.value);
    else
      field.value += typed(event);
    break;

  case FieldKind::Toggle:
    if (event == Event::Character(' ') || event == Event::ArrowLeft ||
        event == Event::ArrowRight)
      field.value = field.value == "true" ? "false" : "true";
    break;

  case FieldKind::Choice: {
    if (field.options.empty())
      break;
    auto it = std::find(field.options.begin(), field.options.end(),
                        field.value);
    size_t index = it == field.options.end()
                       ? 0
                       : static_cast<size_t>(it - field.options.begin());
    if (event == Event::ArrowRight || event == Event::Character(' '))
      index = (index + 1) % field.options.size();
    else if (event == Event::ArrowLeft)
      index = (index + field.options.size() - 1) % field.options.size();
    field.value = field.options[index];
    break;
  }

  case FieldKind::MultiChoice: {
    if (field.options.empty())
      break;
    if (event == Event::ArrowRight)
      m_option = (m_option + 1) % field.options.size();
    else if (event == Event::ArrowLeft)
      m_option = (m_option + field.options.size() - 1) % field.options.size();
    else if (event == Event::Character(' ')) {
      auto selected = splitList(field.value);
      const std::string &option = field.options[m_option];
      auto it = std::find(selected.begin(), selected.end(), option);
      if (it == selected.end())
        selected.push_back(option);
      else
        selected.erase(it);
      field.value = joinList(selected);
    }
    break;
  }

  case FieldKind::ReadOnly:
    break;
  }
  return KeyResult::Consumed;
}

Element WizardOverlay::renderField(const FieldSpec &field, bool focused) const {
  Element label = text(field.label + (field.required ? " *" : "") + ": ") |
                  size(WIDTH, EQUAL, 28);
  Element value;

  switch (field.kind) {
  case FieldKind::Text:
    value = text(field.value + (focused ? "█" : ""));
    break;
  case FieldKind::Secret:
    value = text(std::string(field.value.size(), '*') + (focused ? "█" : ""));
    break;
  case FieldKind::Toggle:
    value = text(field.value == "true" ? "[x]" : "[ ]");
    break;
  case FieldKind::Choice:
    value = text("< " + field.value + " >");
    break;
  case FieldKind::MultiChoice: {
    const auto selected = splitList(field.value);
    Elements options;
    for (size_t i = 0; i < field.options.size(); ++i) {
      const bool on = std::find(selected.begin(), selected.end(),
                                field.options[i]) != selected.end();
      Element option = text((on ? "[x] " : "[ ] ") + field.options[i]);
      if (focused && i == m_option)
        option = option | inverted;
      options.push_back(option);
    }
    if (options.empty())
      options.push_back(text("(nothing to choose from)") | dim);
    value = vbox(std::move(options));
    break;
  }
  case FieldKind::ReadOnly:
    value = text(field.value) | dim;
    break;
  }

  Element row = hbox({label, value | flex});
  if (focused)
    row = row | color(Color::Green) | bold;
  return row;
}

Element WizardOverlay::render() const {
  Elements body;
  if (m_step < m_spec.steps.size()) {
    const std::string position = m_spec.steps.size() > 1
                                     ? " (" + std::to_string(m_step + 1) + "/" +
                                           std::to_string(m_spec.steps.size()) +
                                           ")"
                                     : "";
    body.push_back(text(m_spec.steps[m_step].title + position) | bold);
    const auto fields = visibleFields();
    for (size_t i = 0; i < fields.size(); ++i)
      body.push_back(renderField(*fields[i], i == m_field));
  }
  const bool last = m_step + 1 >= m_spec.steps.size();
  return frame(std::move(body),
               keyHint({{"Tab", "next field"},
                        {"Space", "toggle"},
                        {"Enter", last ? "submit" : "next step"},
                        {"Esc", m_step == 0 ? "cancel" : "back"}}));
}

// ProgressOverlay

void ProgressOverlay::update(const UploadProgress &progress) {
  if (progress.batchId != m_batch_id)
    return;
  m_index = progress.index;
  m_total = progress.total;
  m_file = progress.fileName;
}

void ProgressOverlay::finish(bool success, std::vector<std::string> report) {
  m_done = true;
  m_success = success;
  m_report = std::move(report);
}

Overlay::KeyResult ProgressOverlay::handleKey(const Event &event) {
  if (m_done && (event == Event::Return || event == Event::Escape))
    return KeyResult::Confirm;
  return KeyResult::Consumed;
}

Element ProgressOverlay::render() const {
  Elements body;
  const float ratio =
      m_total == 0 ? 1.0f
                   : static_cast<float>(m_done ? m_total : m_index) /
                         static_cast<float>(m_total);

  if (!m_done) {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    const size_t frame =
        static_cast<size_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now)
                .count() /
            80) %
        kSpinner.size();
    body.push_back(hbox({text(kSpinner[frame]) | color(Color::Cyan) | bold,
                         text(" Uploading " + std::to_string(m_index + 1) +
                              "/" + std::to_string(m_total) + ": " + m_file)}));
  } else {
    body.push_back(text(m_success ? "Upload finished" : "Upload stopped") |
                   bold | color(m_success ? Color::Green : Color::Red));
  }
  body.push_back(gauge(ratio) | color(Color::Green));
  for (const auto &line : m_report)
    body.push_back(text(line));

  return frame(std::move(body), m_done ? keyHint({{"Enter", "close"}})
                                       : text("please wait") | dim);
}

// InfoOverlay

Overlay::KeyResult InfoOverlay::handleKey(const Event &event) {
  if (isCloseKey(event) || event == Event::Character('?'))
    return KeyResult::Confirm;
  return scrollKey(event, m_offset, m_lines.size());
}

Element InfoOverlay::render() const {
  return frame(scrolled(m_lines, m_offset),
               keyHint({{"↑/↓", "scroll"}, {"Esc", "close"}}));
}

// PreviewOverlay

void PreviewOverlay::setContent(std::vector<std::string> lines) {
  m_loading = false;
  m_lines = std::move(lines);
  m_offset = 0;
}

void PreviewOverlay::setFailed(const std::string &error) {
  m_loading = false;
  m_lines.clear();
  setError(error);
}

Overlay::KeyResult PreviewOverlay::handleKey(const Event &event) {
  if (isCloseKey(event))
    return KeyResult::Confirm;
  return scrollKey(event, m_offset, m_lines.size());
}

Element PreviewOverlay::render() const {
  Elements body;
  if (m_loading)
    body.push_back(text("Loading...") | color(Color::Yellow));
  else
    body = scrolled(m_lines, m_offset);
  return frame(std::move(body),
               keyHint({{"↑/↓", "scroll"}, {"Esc", "close"}}));
}

// SearchOverlay

std::vector<const SearchCandidate *> SearchOverlay::matches() const {
  std::vector<const SearchCandidate *> out;
  for (const auto &candidate : m_candidates) {
    if (m_query.empty() || containsIgnoreCase(candidate.name, m_query))
      out.push_back(&candidate);
  }
  return out;
}

Overlay::KeyResult SearchOverlay::handleKey(const Event &event) {
  if (event == Event::Escape)
    return KeyResult::Cancel;
  if (event == Event::Return) {
    if (matches().empty()) {
      setError("No match for '" + m_query + "'");
      return KeyResult::Consumed;
    }
    return KeyResult::Confirm;
  }

  const size_t count = matches().size();
  if (event == Event::ArrowDown) {
    if (m_selected + 1 < count)
      ++m_selected;
  } else if (event == Event::ArrowUp) {
    if (m_selected > 0)
      --m_selected;
  } else if (event == Event::Backspace) {
    eraseLast(m_query);
    m_selected = 0;
  } else {
    const std::string input = typed(event);
    if (!input.empty()) {
      m_query += input;
      m_selected = 0;
    }
  }
  setError("");
  return KeyResult::Consumed;
}

FormValues SearchOverlay::values() const {
  const auto found = matches();
  if (found.empty())
    return {};
  const size_t index = std::min(m_selected, found.size() - 1);
  return {{"node_id", std::to_string(found[index]->nodeId)}};
}

Element SearchOverlay::render() const {
  Elements body;
  body.push_back(hbox({text("/ ") | color(Color::Green), text(m_query),
                       text("█") | blink}));
  body.push_back(separator());

  const auto found = matches();
  const size_t first =
      m_selected >= kMaxShown ? m_selected - kMaxShown + 1 : 0;
  for (size_t i = first; i < found.size() && i < first + kMaxShown; ++i) {
    Element row = hbox({text(found[i]->path) | flex,
                        text(" " + found[i]->kind) | color(Color::GrayLight)});
    if (i == m_selected)
      row = row | inverted;
    body.push_back(row);
  }
  body.push_back(text(std::to_string(found.size()) + " match(es)") | dim);
  return frame(std::move(body),
               keyHint({{"Enter", "go to"}, {"Esc", "cancel"}}));
}

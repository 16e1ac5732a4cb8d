#include "localbrowser.hpp"

#include <algorithm>

#include "utils.hpp"

LocalBrowser::LocalBrowser(const std::filesystem::path &start_dir)
    : m_current_dir(start_dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(m_current_dir, ec)) {
    m_current_dir = std::filesystem::current_path();
  }
  refresh();
}

void LocalBrowser::applyMarks() {
  for (auto &entry : m_entries) {
    entry.setMarked(m_marked.count(entry.getPath()) > 0);
  }
}

void LocalBrowser::refresh() {
  std::string previous;
  if (const FileInfo *info = current())
    previous = info->getPath();

  m_entries = m_scanner.scanDirectory(m_current_dir, true);
  m_last_error = m_scanner.lastError();

  // Forget marks for files that disappeared
  for (auto it = m_marked.begin(); it != m_marked.end();) {
    bool present = std::any_of(
        m_entries.begin(), m_entries.end(),
        [&](const FileInfo &info) { return info.getPath() == *it; });
    it = present ? std::next(it) : m_marked.erase(it);
  }
  applyMarks();

  m_selected = 0;
  for (size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].getPath() == previous) {
      m_selected = static_cast<int>(i);
      break;
    }
  }
}

bool LocalBrowser::changeDirectory(const std::filesystem::path &dir) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(dir, ec);
  if (ec || !std::filesystem::is_directory(canonical, ec)) {
    m_last_error = "Not a directory: " + dir.string();
    return false;
  }

  m_current_dir = canonical;
  m_marked.clear();
  m_selected = 0;
  refresh();
  m_selected = 0;
  return true;
}

bool LocalBrowser::enterSelected() {
  const FileInfo *info = current();
  if (!info || !info->isDirectory())
    return false;
  return changeDirectory(info->getPath());
}

bool LocalBrowser::goUp() {
  if (!m_current_dir.has_parent_path() ||
      m_current_dir == m_current_dir.root_path())
    return false;
  return changeDirectory(m_current_dir.parent_path());
}

void LocalBrowser::moveCursor(int delta) { setCursor(m_selected + delta); }

void LocalBrowser::setCursor(int index) {
  if (m_entries.empty()) {
    m_selected = 0;
    return;
  }
  int last = static_cast<int>(m_entries.size()) - 1;
  m_selected = std::max(0, std::min(index, last));
}

void LocalBrowser::toggleMark() {
  const FileInfo *info = current();
  if (!info || info->isDirectory())
    return;

  if (m_marked.count(info->getPath()))
    m_marked.erase(info->getPath());
  else
    m_marked.insert(info->getPath());
  applyMarks();
}

void LocalBrowser::clearMarks() {
  m_marked.clear();
  applyMarks();
}

std::vector<FileInfo> LocalBrowser::selectedFiles() const {
  std::vector<FileInfo> files;
  for (const auto &entry : m_entries) {
    if (entry.isMarked() && entry.isUploadable())
      files.push_back(entry);
  }

  if (files.empty() && m_marked.empty()) {
    if (const FileInfo *info = current()) {
      if (info->isUploadable())
        files.push_back(*info);
    }
  }
  return files;
}

const FileInfo *LocalBrowser::current() const {
  return safe_at(m_entries, m_selected);
}

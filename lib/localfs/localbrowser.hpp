/**
 * @file localbrowser.hpp
 * @brief Cursor, navigation and multi-selection over a local directory
 *
 * LocalBrowser is the state behind the left panel of the main screen. It
 * owns the scanned entries of the current directory, the cursor position
 * and the set of marked files, and answers "which files would be uploaded
 * right now".
 *
 * @see FileScanner
 * @see FileInfo
 */

#ifndef LOCAL_BROWSER_HPP
#define LOCAL_BROWSER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "fileinfo.hpp"
#include "filescanner.hpp"

class LocalBrowser {
private:
  std::filesystem::path m_current_dir;
  std::vector<FileInfo> m_entries;
  std::set<std::string> m_marked;
  int m_selected = 0;
  std::string m_last_error;
  FileScanner m_scanner;

  void applyMarks();

public:
  explicit LocalBrowser(const std::filesystem::path &start_dir);

  /** @brief Re-scans the current directory, keeping cursor and marks when possible */
  void refresh();

  /**
   * @brief Changes into @p dir and scans it
   * @return false if @p dir is not a readable directory (state unchanged)
   */
  bool changeDirectory(const std::filesystem::path &dir);

  /**
   * @brief Activates the entry under the cursor
   *
   * Directories (including "..") are entered. Files are left alone.
   *
   * @return true if the directory changed
   */
  bool enterSelected();

  /** @brief Goes to the parent directory */
  bool goUp();

  void moveCursor(int delta);
  void setCursor(int index);
  int cursor() const { return m_selected; }

  /** @brief Toggles the mark on the entry under the cursor (files only) */
  void toggleMark();
  void clearMarks();

  /**
   * @brief Files an upload would act on
   *
   * Marked uploadable files in display order, or the uploadable file under
   * the cursor when nothing is marked. Empty if neither applies.
   */
  std::vector<FileInfo> selectedFiles() const;

  const FileInfo *current() const;
  const std::vector<FileInfo> &entries() const { return m_entries; }
  const std::filesystem::path &currentDir() const { return m_current_dir; }
  size_t markedCount() const { return m_marked.size(); }
  const std::string &lastError() const { return m_last_error; }
};

#endif // LOCAL_BROWSER_HPP

/**
 * @file filescanner.hpp
 * @brief Directory listing for the local file panel
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "fileinfo.hpp"

/**
 * @class FileScanner
 * @brief Lists one directory as FileInfo entries
 *
 * Entries come back as ".." (when requested), directories, then files, each
 * group sorted by name. Every file carries the geospatial type detected
 * from its extension.
 *
 * @see FileInfo
 * @see LocalBrowser
 */
class FileScanner {
private:
  bool m_hide_dotfiles = true;
  std::string m_last_error;

  void addEntry(const std::filesystem::directory_entry &entry,
                std::vector<FileInfo> &results) const;

  static void sortEntries(std::vector<FileInfo> &results);

public:
  FileScanner() = default;
  explicit FileScanner(bool hide_dotfiles) : m_hide_dotfiles(hide_dotfiles) {}

  /**
   * @brief Lists the entries of @p dir_path
   *
   * @param dir_path Directory to list
   * @param include_parent Adds a ".." entry unless @p dir_path is the root
   * @return Sorted entries; on a read error the entries collected so far
   *
   * @note The error text of a failed listing is kept in lastError()
   */
  std::vector<FileInfo> scanDirectory(const std::filesystem::path &dir_path,
                                      bool include_parent);

  /** @brief Error message of the most recent scan, empty on success */
  const std::string &lastError() const { return m_last_error; }
};

#endif // FILESCANNER_HPP

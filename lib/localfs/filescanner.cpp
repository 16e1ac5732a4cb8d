/**
 * @file filescanner.cpp
 * @brief Implementation of the local directory listing
 */

#include "filescanner.hpp"
#include <algorithm>

void FileScanner::addEntry(const std::filesystem::directory_entry &entry,
                           std::vector<FileInfo> &results) const {
  const std::string name = entry.path().filename().string();
  if (m_hide_dotfiles && !name.empty() && name[0] == '.')
    return;

  std::error_code ec;
  const bool is_dir = entry.is_directory(ec);
  long long size = 0;
  if (!is_dir) {
    auto file_size = entry.file_size(ec);
    if (!ec)
      size = static_cast<long long>(file_size); // unreadable size stays 0
  }
  results.emplace_back(entry.path().string(), size, is_dir);
}

std::vector<FileInfo>
FileScanner::scanDirectory(const std::filesystem::path &dir_path,
                           bool include_parent) {
  std::vector<FileInfo> results;
  m_last_error.clear();

  if (include_parent && dir_path.has_parent_path() &&
      dir_path != dir_path.root_path())
    results.emplace_back(dir_path.parent_path().string(), 0, true, true);

  std::error_code ec;
  std::filesystem::directory_iterator it(dir_path, ec);
  const std::filesystem::directory_iterator end;
  while (!ec && it != end) {
    addEntry(*it, results);
    it.increment(ec);
  }
  if (ec)
    m_last_error = dir_path.string() + ": " + ec.message();

  sortEntries(results);
  return results;
}

/**
 * @brief ".." first, then directories, then files, each alphabetical
 */
void FileScanner::sortEntries(std::vector<FileInfo> &results) {
  std::sort(results.begin(), results.end(),
            [](const FileInfo &a, const FileInfo &b) {
              if (a.isParentDir() != b.isParentDir())
                return a.isParentDir();
              if (a.isDirectory() != b.isDirectory())
                return a.isDirectory();
              return a.getDisplayName() < b.getDisplayName();
            });
}

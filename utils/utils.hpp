/**
 * @file utils.hpp
 * @brief Small helpers shared by the libraries and the terminal front end
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable size formatting
 * - toLower / containsIgnoreCase: case-insensitive matching for search
 * - joinPath: renders a tree path ("conn/ws/Layers/roads")
 * - truncateList: bulleted, length-limited lists for dialogs
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef> // size_t
#include <cstdio>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access (can be negative or out of bounds)
 *
 * @return const T* Pointer to the element, or nullptr if out of bounds
 *
 * Example usage:
 * @code
 * const FileInfo* file = safe_at(files, selected_index);
 * if (file) {
 *     std::cout << file->getPath();
 * }
 * @endcode
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) and one decimal place.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1048576) → "1.0 MB"
 */
inline std::string formatBytes(long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

inline std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

inline bool containsIgnoreCase(const std::string &haystack,
                               const std::string &needle) {
  return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

inline std::string trim(const std::string &value) {
  auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

/** @brief Joins path segments with '/' (empty vector gives "/") */
inline std::string joinPath(const std::vector<std::string> &segments) {
  if (segments.empty())
    return "/";
  std::string out;
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i > 0)
      out += "/";
    out += segments[i];
  }
  return out;
}

/**
 * @brief One name per line, cut after @p limit entries
 *
 * Produces "  - a\n  - b\n  ... and 3 more" for confirmation dialogs.
 */
inline std::string truncateList(const std::vector<std::string> &items,
                                size_t limit) {
  std::string out;
  for (size_t i = 0; i < items.size() && i < limit; ++i) {
    out += "  - " + items[i] + "\n";
  }
  if (items.size() > limit) {
    out += "  ... and " + std::to_string(items.size() - limit) + " more\n";
  }
  return out;
}

#endif // UTILS_HPP

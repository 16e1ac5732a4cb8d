#ifndef FILE_INFO_HPP
#define FILE_INFO_HPP

#include <filesystem>
#include <string>

#include "filetype.hpp"

class FileInfo {
private:
  std::string m_path;
  long long m_size;
  bool m_isDir;
  bool m_isParent = false;
  bool m_marked = false;
  FileType m_type;

public:
  FileInfo(const std::string &p, long long s, bool isDir, bool isParent = false)
      : m_path(p), m_size(s), m_isDir(isDir), m_isParent(isParent),
        m_type(detectFileType(p, isDir)) {}

  const std::string &getPath() const { return m_path; }
  long long getFileSize() const { return m_size; }
  bool isDirectory() const { return m_isDir; }
  bool isParentDir() const { return m_isParent; }
  FileType getType() const { return m_type; }

  std::string getDisplayName() const {
    if (m_isParent)
      return ".."; // <-- Parent Dir

    std::filesystem::path p(m_path);
    std::string name = p.filename().string();

    if (name.empty() && m_isDir) {
      // root or current dir
      return p.string();
    }

    return m_isDir ? name + "/" : name;
  }

  /** @brief File name without its extension, used as the remote store name */
  std::string getStem() const {
    return std::filesystem::path(m_path).stem().string();
  }

  bool isUploadable() const { return !m_isDir && canUpload(m_type); }

  int getColorCode() const {
    if (m_isDir)
      return 4; // Blue: Directories
    if (isStyleFile(m_type))
      return 5; // Magenta: styles
    if (canUpload(m_type))
      return 2; // Green: uploadable data
    if (m_type == FileType::GeoJSON)
      return 3; // Yellow: recognised but not uploadable
    return 7;   // White: Normal
  }

  bool isMarked() const { return m_marked; }
  void setMarked(bool marked) { m_marked = marked; }
};

#endif // FILE_INFO_HPP

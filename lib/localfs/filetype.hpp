/**
 * @file filetype.hpp
 * @brief Geospatial file type detection for the local browser
 *
 * Maps file extensions to the formats the upload pipeline understands and
 * answers the two questions the rest of the application asks about a file:
 * can it be uploaded, and can its uploaded representation be compared
 * against the local source afterwards.
 */

#ifndef FILE_TYPE_HPP
#define FILE_TYPE_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

/**
 * @enum FileType
 * @brief Formats recognised by the local file browser
 */
enum class FileType {
  Directory,
  Shapefile,
  GeoPackage,
  GeoTIFF,
  GeoJSON,
  SLD,
  CSS,
  Other
};

/**
 * @brief Detects the file type from the extension of @p path
 *
 * Shapefiles are uploaded as ZIP archives, so `.zip` counts as a shapefile
 * bundle as well as `.shp`. Comparison is case-insensitive.
 *
 * @param path File path to inspect
 * @param is_directory True if the path names a directory
 * @return FileType Detected type, Other if the extension is unknown
 */
inline FileType detectFileType(const std::filesystem::path &path,
                               bool is_directory = false) {
  if (is_directory)
    return FileType::Directory;

  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (ext == ".shp" || ext == ".zip")
    return FileType::Shapefile;
  if (ext == ".gpkg")
    return FileType::GeoPackage;
  if (ext == ".tif" || ext == ".tiff" || ext == ".geotiff")
    return FileType::GeoTIFF;
  if (ext == ".geojson" || ext == ".json")
    return FileType::GeoJSON;
  if (ext == ".sld")
    return FileType::SLD;
  if (ext == ".css")
    return FileType::CSS;
  return FileType::Other;
}

/** @brief True for formats the remote server accepts as a file upload */
inline bool canUpload(FileType type) {
  switch (type) {
  case FileType::Shapefile:
  case FileType::GeoPackage:
  case FileType::GeoTIFF:
  case FileType::SLD:
  case FileType::CSS:
    return true;
  default:
    return false;
  }
}

/**
 * @brief True for vector formats whose published layer can be compared
 *        with the local source (feature count, geometry, attributes)
 */
inline bool isVerifiable(FileType type) {
  return type == FileType::Shapefile || type == FileType::GeoPackage;
}

/** @brief True for style documents (uploaded as styles, not stores) */
inline bool isStyleFile(FileType type) {
  return type == FileType::SLD || type == FileType::CSS;
}

/** @brief Short label used in the file panel */
inline std::string fileTypeLabel(FileType type) {
  switch (type) {
  case FileType::Directory:
    return "DIR";
  case FileType::Shapefile:
    return "SHP";
  case FileType::GeoPackage:
    return "GPKG";
  case FileType::GeoTIFF:
    return "TIFF";
  case FileType::GeoJSON:
    return "JSON";
  case FileType::SLD:
    return "SLD";
  case FileType::CSS:
    return "CSS";
  default:
    return "";
  }
}

#endif // FILE_TYPE_HPP

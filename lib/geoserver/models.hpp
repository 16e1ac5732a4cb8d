/**
 * @file models.hpp
 * @brief Plain data types exchanged with a GeoServer instance
 */

#ifndef GEOSERVER_MODELS_HPP
#define GEOSERVER_MODELS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @struct Connection
 * @brief One configured remote server
 */
struct Connection {
  std::string id;
  std::string name;
  std::string url;
  std::string username;
  std::string password;
  bool is_active = false;
};

/** @brief Entry of a listing call, in server order */
struct ResourceItem {
  std::string name;
  std::optional<bool> enabled;
};

struct BoundingBox {
  double minx = 0;
  double miny = 0;
  double maxx = 0;
  double maxy = 0;
  std::string crs;
  bool valid = false;
};

struct WorkspaceConfig {
  std::string name;
  bool isolated = false;
  bool enabled = true;
  bool wms = true;
  bool wfs = true;
  bool wcs = true;
  bool wmts = true;
  bool wps = false;
};

enum class DataStoreKind { Directory, GeoPackage, PostGIS, WFS };

struct DataStoreConfig {
  std::string name;
  std::string workspace;
  std::string description;
  bool enabled = true;
  DataStoreKind kind = DataStoreKind::Directory;
  /** @brief Connection parameters (url, host, port, database, ...) */
  std::map<std::string, std::string> params;
};

enum class CoverageStoreKind { GeoTIFF, WorldImage, ImageMosaic };

struct CoverageStoreConfig {
  std::string name;
  std::string workspace;
  std::string description;
  bool enabled = true;
  CoverageStoreKind kind = CoverageStoreKind::GeoTIFF;
  std::string url;
};

enum class StyleFormat { SLD, CSS };

struct StyleContent {
  std::string name;
  StyleFormat format = StyleFormat::SLD;
  std::string body;
};

struct LayerConfig {
  std::string name;
  std::string workspace;
  std::string store;
  std::string storeType;
  bool enabled = true;
  bool advertised = true;
  bool queryable = true;
  std::string defaultStyle;
  std::vector<std::string> styles;
  BoundingBox bounds;
};

struct LayerGroupConfig {
  std::string name;
  std::string workspace;
  std::string title;
  /** @brief SINGLE, NAMED, CONTAINER or EO */
  std::string mode = "SINGLE";
  std::vector<std::string> layers;
  std::vector<std::string> styles;
  BoundingBox bounds;
};

/** @brief Tile cache settings of one layer (GeoWebCache) */
struct GwcLayer {
  std::string name;
  bool enabled = true;
  std::vector<std::string> gridSubsets;
  std::vector<std::string> mimeFormats;
};

/** @brief One seed, reseed or truncate task */
struct GwcSeedRequest {
  /** @brief "seed", "reseed" or "truncate" */
  std::string type = "seed";
  std::string gridSetId;
  std::string format;
  int zoomStart = 0;
  int zoomStop = 10;
  int threadCount = 2;
};

struct ContactInfo {
  std::string person;
  std::string position;
  std::string organization;
  std::string email;
  std::string phone;
  std::string address;
  std::string city;
  std::string country;
};

/**
 * @struct ServerStatus
 * @brief Snapshot produced by one health probe
 *
 * A failed probe is an offline status with @ref error set, never a
 * missing entry.
 */
struct ServerStatus {
  std::string connectionId;
  std::string connectionName;
  std::string url;
  bool online = false;
  int64_t responseTimeMs = 0;
  int64_t memoryUsed = 0;
  int64_t memoryTotal = 0;
  double memoryUsedPct = 0.0;
  int workspaceCount = 0;
  int layerCount = 0;
  int dataStoreCount = 0;
  int styleCount = 0;
  std::string version;
  std::string error;
};

/** @brief Structural description of a vector dataset */
struct FeatureSummary {
  std::string layerName;
  int64_t featureCount = -1;
  std::string geometryType;
  std::vector<std::string> attributes;
  BoundingBox extent;
};

std::string toString(DataStoreKind kind);
std::string toString(CoverageStoreKind kind);
std::string toString(StyleFormat format);

#endif // GEOSERVER_MODELS_HPP

/**
 * @file geoserverjson.hpp
 * @brief JSON encoding and decoding of GeoServer REST payloads
 *
 * Kept apart from the transport so the quirks of the REST API can be
 * tested without a server:
 * - empty collections are returned as "" instead of an object
 * - single-element collections may be an object instead of an array
 * - connection parameters are an "entry" list of {"@key", "$"} pairs
 */

#ifndef GEOSERVERJSON_HPP
#define GEOSERVERJSON_HPP

#include <string>
#include <vector>

#include "models.hpp"
#include "result.hpp"

/**
 * @brief Parses a listing such as {"workspaces": {"workspace": [...]}}
 *
 * @param body Response body
 * @param outer Collection key ("workspaces", "dataStores", ...)
 * @param inner Element key ("workspace", "dataStore", ...)
 */
Result<std::vector<ResourceItem>> parseNamedList(const std::string &body,
                                                 const std::string &outer,
                                                 const std::string &inner);

Result<WorkspaceConfig> parseWorkspace(const std::string &body);
std::string workspaceBody(const WorkspaceConfig &config);
/** @brief Service settings body ({"wms": {"enabled": ...}}) */
std::string serviceSettingsBody(const std::string &service, bool enabled);

Result<DataStoreConfig> parseDataStore(const std::string &body,
                                       const std::string &workspace);
std::string dataStoreBody(const DataStoreConfig &config, bool with_params);

Result<CoverageStoreConfig> parseCoverageStore(const std::string &body,
                                               const std::string &workspace);
std::string coverageStoreBody(const CoverageStoreConfig &config,
                              bool with_url);

Result<LayerConfig> parseLayer(const std::string &body,
                               const std::string &workspace);
std::string layerBody(const LayerConfig &config);

/** @brief Native bounding box of a feature type or coverage resource */
BoundingBox parseResourceBounds(const std::string &body);

Result<LayerGroupConfig> parseLayerGroup(const std::string &body,
                                         const std::string &workspace);
std::string layerGroupBody(const LayerGroupConfig &config);

Result<ContactInfo> parseContact(const std::string &body);
std::string contactBody(const ContactInfo &contact);

/** @brief GeoServerLayer document of /gwc/rest/layers/<name>.json */
Result<GwcLayer> parseGwcLayer(const std::string &body);
/** @brief seedRequest document for /gwc/rest/seed/<name>.json */
std::string gwcSeedBody(const std::string &layer, const GwcSeedRequest &request);

/** @brief Extracts the GeoServer version from about/version */
Result<std::string> parseVersion(const std::string &body);

/** @brief Fills memory fields of @p status from about/system-status */
void parseSystemStatus(const std::string &body, ServerStatus &status);

/** @brief Geometry type and attributes from a WFS DescribeFeatureType (JSON) */
Result<FeatureSummary> parseDescribeFeatureType(const std::string &body);

/** @brief numberMatched / numberOfFeatures from a WFS hits response */
Result<int64_t> parseFeatureHits(const std::string &body);

#endif // GEOSERVERJSON_HPP

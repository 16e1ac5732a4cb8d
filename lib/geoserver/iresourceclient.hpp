#ifndef IRESOURCECLIENT_HPP
#define IRESOURCECLIENT_HPP

#include <string>
#include <vector>

#include "filetype.hpp"
#include "models.hpp"
#include "result.hpp"

/**
 * @class IResourceClient
 * @brief Remote resource API of a single server connection
 *
 * Every call blocks until the server answered (or the transport gave up)
 * and reports failure as an error string meant for the operator. Calls are
 * made from background tasks only.
 */
class IResourceClient {
public:
  virtual ~IResourceClient() = default;

  // Listings, in server order
  virtual Result<std::vector<ResourceItem>> listWorkspaces() = 0;
  virtual Result<std::vector<ResourceItem>> listDataStores(const std::string &workspace) = 0;
  virtual Result<std::vector<ResourceItem>> listCoverageStores(const std::string &workspace) = 0;
  virtual Result<std::vector<ResourceItem>> listStyles(const std::string &workspace) = 0;
  virtual Result<std::vector<ResourceItem>> listLayers(const std::string &workspace) = 0;
  virtual Result<std::vector<ResourceItem>> listLayerGroups(const std::string &workspace) = 0;

  // Workspaces
  virtual Status createWorkspace(const WorkspaceConfig &config) = 0;
  virtual Result<WorkspaceConfig> getWorkspaceConfig(const std::string &name) = 0;
  virtual Status updateWorkspace(const std::string &name, const WorkspaceConfig &config) = 0;
  virtual Status deleteWorkspace(const std::string &name) = 0;

  // Data stores
  virtual Status createDataStore(const DataStoreConfig &config) = 0;
  virtual Result<DataStoreConfig> getDataStoreConfig(const std::string &workspace, const std::string &name) = 0;
  virtual Status updateDataStore(const std::string &name, const DataStoreConfig &config) = 0;
  virtual Status deleteDataStore(const std::string &workspace, const std::string &name) = 0;

  // Coverage stores
  virtual Status createCoverageStore(const CoverageStoreConfig &config) = 0;
  virtual Result<CoverageStoreConfig> getCoverageStoreConfig(const std::string &workspace, const std::string &name) = 0;
  virtual Status updateCoverageStore(const std::string &name, const CoverageStoreConfig &config) = 0;
  virtual Status deleteCoverageStore(const std::string &workspace, const std::string &name) = 0;

  // Styles
  virtual Status createStyle(const std::string &workspace, const StyleContent &style) = 0;
  virtual Result<StyleContent> getStyle(const std::string &workspace, const std::string &name) = 0;
  virtual Status updateStyle(const std::string &workspace, const StyleContent &style) = 0;
  virtual Status deleteStyle(const std::string &workspace, const std::string &name) = 0;

  // Layers
  virtual Result<LayerConfig> getLayerConfig(const std::string &workspace, const std::string &name) = 0;
  virtual Status updateLayer(const LayerConfig &config) = 0;
  virtual Status deleteLayer(const std::string &workspace, const std::string &name) = 0;
  /** @brief Publishes (or re-enables) the layer named after @p store */
  virtual Status publishFromStore(const std::string &workspace, const std::string &store, bool coverage) = 0;

  // Layer groups
  virtual Status createLayerGroup(const LayerGroupConfig &config) = 0;
  virtual Result<LayerGroupConfig> getLayerGroup(const std::string &workspace, const std::string &name) = 0;
  virtual Status updateLayerGroup(const std::string &name, const LayerGroupConfig &config) = 0;
  virtual Status deleteLayerGroup(const std::string &workspace, const std::string &name) = 0;

  // Server settings
  virtual Result<ContactInfo> getContact() = 0;
  virtual Status updateContact(const ContactInfo &contact) = 0;

  /**
   * @brief Uploads a local file into @p workspace
   *
   * Data files become a store named @p storeName; style documents become a
   * style of that name.
   */
  virtual Status uploadFile(const std::string &workspace, const std::string &storeName,
                            const std::string &localPath, FileType type) = 0;

  // Downloads (raw bytes)
  virtual Result<std::string> downloadLayer(const std::string &workspace, const std::string &name) = 0;
  virtual Result<std::string> downloadCoverage(const std::string &workspace, const std::string &store) = 0;
  virtual Result<std::string> downloadStyle(const std::string &workspace, const std::string &name) = 0;

  // Tile cache; @p layer is the qualified "workspace:name"
  virtual Result<GwcLayer> getGwcLayer(const std::string &layer) = 0;
  /** @brief Queues a seed, reseed or truncate task on the server */
  virtual Status seedLayer(const std::string &layer, const GwcSeedRequest &request) = 0;
  virtual Status truncateLayer(const std::string &layer, const GwcSeedRequest &request) = 0;

  /** @brief Version, memory and resource counts; failure means offline */
  virtual Result<ServerStatus> fetchStatus() = 0;

  /** @brief Feature count, geometry type and attributes of a published layer */
  virtual Result<FeatureSummary> describeLayer(const std::string &workspace, const std::string &layer) = 0;
};

#endif // IRESOURCECLIENT_HPP

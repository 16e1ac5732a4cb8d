/**
 * @file geoserverclient.hpp
 * @brief IResourceClient implementation for the GeoServer REST API
 *
 * Talks to `<base>/rest/...` with HTTP basic authentication and JSON
 * bodies. Tile caches go through `<base>/gwc/rest/...`. WFS and WCS endpoints are used for downloads and for the
 * structural summary of published layers.
 *
 * @see IResourceClient
 * @see HttpClient
 */

#ifndef GEOSERVERCLIENT_HPP
#define GEOSERVERCLIENT_HPP

#include <string>

#include "httpclient.hpp"
#include "iresourceclient.hpp"

class GeoServerClient : public IResourceClient {
private:
  std::string m_base_url;
  HttpClient m_http;

  std::string rest(const std::string &path) const;
  std::string gwc(const std::string &path) const;
  std::string workspacePath(const std::string &workspace) const;

  HttpResponse get(const std::string &path) const;
  HttpResponse send(const std::string &method, const std::string &path,
                    const std::string &body) const;
  Status expectOk(const HttpResponse &response, const std::string &what) const;
  Result<std::vector<ResourceItem>> list(const std::string &path,
                                         const std::string &outer,
                                         const std::string &inner,
                                         const std::string &what) const;
  Result<std::string> download(const std::string &url,
                               const std::string &what) const;

public:
  explicit GeoServerClient(const Connection &connection);

  const std::string &baseUrl() const { return m_base_url; }

  Result<std::vector<ResourceItem>> listWorkspaces() override;
  Result<std::vector<ResourceItem>> listDataStores(const std::string &workspace) override;
  Result<std::vector<ResourceItem>> listCoverageStores(const std::string &workspace) override;
  Result<std::vector<ResourceItem>> listStyles(const std::string &workspace) override;
  Result<std::vector<ResourceItem>> listLayers(const std::string &workspace) override;
  Result<std::vector<ResourceItem>> listLayerGroups(const std::string &workspace) override;

  Status createWorkspace(const WorkspaceConfig &config) override;
  Result<WorkspaceConfig> getWorkspaceConfig(const std::string &name) override;
  Status updateWorkspace(const std::string &name, const WorkspaceConfig &config) override;
  Status deleteWorkspace(const std::string &name) override;

  Status createDataStore(const DataStoreConfig &config) override;
  Result<DataStoreConfig> getDataStoreConfig(const std::string &workspace, const std::string &name) override;
  Status updateDataStore(const std::string &name, const DataStoreConfig &config) override;
  Status deleteDataStore(const std::string &workspace, const std::string &name) override;

  Status createCoverageStore(const CoverageStoreConfig &config) override;
  Result<CoverageStoreConfig> getCoverageStoreConfig(const std::string &workspace, const std::string &name) override;
  Status updateCoverageStore(const std::string &name, const CoverageStoreConfig &config) override;
  Status deleteCoverageStore(const std::string &workspace, const std::string &name) override;

  Status createStyle(const std::string &workspace, const StyleContent &style) override;
  Result<StyleContent> getStyle(const std::string &workspace, const std::string &name) override;
  Status updateStyle(const std::string &workspace, const StyleContent &style) override;
  Status deleteStyle(const std::string &workspace, const std::string &name) override;

  Result<LayerConfig> getLayerConfig(const std::string &workspace, const std::string &name) override;
  Status updateLayer(const LayerConfig &config) override;
  Status deleteLayer(const std::string &workspace, const std::string &name) override;
  Status publishFromStore(const std::string &workspace, const std::string &store, bool coverage) override;

  Status createLayerGroup(const LayerGroupConfig &config) override;
  Result<LayerGroupConfig> getLayerGroup(const std::string &workspace, const std::string &name) override;
  Status updateLayerGroup(const std::string &name, const LayerGroupConfig &config) override;
  Status deleteLayerGroup(const std::string &workspace, const std::string &name) override;

  Result<ContactInfo> getContact() override;
  Status updateContact(const ContactInfo &contact) override;

  Status uploadFile(const std::string &workspace, const std::string &storeName,
                    const std::string &localPath, FileType type) override;

  Result<std::string> downloadLayer(const std::string &workspace, const std::string &name) override;
  Result<std::string> downloadCoverage(const std::string &workspace, const std::string &store) override;
  Result<std::string> downloadStyle(const std::string &workspace, const std::string &name) override;

  Result<GwcLayer> getGwcLayer(const std::string &layer) override;
  Status seedLayer(const std::string &layer, const GwcSeedRequest &request) override;
  Status truncateLayer(const std::string &layer, const GwcSeedRequest &request) override;

  Result<ServerStatus> fetchStatus() override;
  Result<FeatureSummary> describeLayer(const std::string &workspace, const std::string &layer) override;
};

#endif // GEOSERVERCLIENT_HPP

#include "geoserverclient.hpp"

#include <cstdlib>
#include <filesystem>
#include <random>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "geoserverjson.hpp"
#include "utils.hpp"

namespace {

std::string shellQuote(const std::string &value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  return out + "'";
}

std::string styleContentType(StyleFormat format) {
  return format == StyleFormat::CSS ? "application/vnd.geoserver.geocss+css"
                                    : "application/vnd.ogc.sld+xml";
}

/**
 * Shapefiles travel as ZIP archives. A bare .shp is bundled with its
 * companion files into a temporary archive the caller removes afterwards.
 */
Result<std::string> bundleShapefile(const std::filesystem::path &shp) {
  namespace fs = std::filesystem;
  std::random_device rd;
  fs::path archive = fs::temp_directory_path() /
                     (shp.stem().string() + "-" + std::to_string(rd()) + ".zip");

  std::string command = "zip -j -q " + shellQuote(archive.string());
  for (const char *ext : {".shp", ".shx", ".dbf", ".prj", ".cpg", ".qix"}) {
    fs::path part = shp;
    part.replace_extension(ext);
    std::error_code ec;
    if (fs::exists(part, ec))
      command += " " + shellQuote(part.string());
  }

  int rc = std::system(command.c_str());
  if (rc != 0) {
    return Result<std::string>::failure(
        "failed to bundle shapefile (zip exited with " + std::to_string(rc) +
        ")");
  }
  return Result<std::string>::success(archive.string());
}

} // namespace

GeoServerClient::GeoServerClient(const Connection &connection)
    : m_base_url(connection.url),
      m_http(connection.username, connection.password) {
  while (!m_base_url.empty() && m_base_url.back() == '/')
    m_base_url.pop_back();
}

std::string GeoServerClient::rest(const std::string &path) const {
  return m_base_url + "/rest" + path;
}

std::string GeoServerClient::gwc(const std::string &path) const {
  return m_base_url + "/gwc/rest" + path;
}

std::string GeoServerClient::workspacePath(const std::string &workspace) const {
  return "/workspaces/" + HttpClient::escape(workspace);
}

HttpResponse GeoServerClient::get(const std::string &path) const {
  return m_http.request("GET", rest(path));
}

HttpResponse GeoServerClient::send(const std::string &method,
                                   const std::string &path,
                                   const std::string &body) const {
  return m_http.request(method, rest(path), body,
                        body.empty() ? "" : "application/json");
}

Status GeoServerClient::expectOk(const HttpResponse &response,
                                 const std::string &what) const {
  if (response.ok())
    return Status::success();
  spdlog::warn("{} ({})", response.describe(what), m_base_url);
  return Status::failure(response.describe(what));
}

Result<std::vector<ResourceItem>>
GeoServerClient::list(const std::string &path, const std::string &outer,
                      const std::string &inner, const std::string &what) const {
  auto response = get(path);
  if (!response.ok())
    return Result<std::vector<ResourceItem>>::failure(
        expectOk(response, "failed to get " + what));
  return parseNamedList(response.body, outer, inner);
}

Result<std::string> GeoServerClient::download(const std::string &url,
                                              const std::string &what) const {
  auto response = m_http.request("GET", url, "", "", "");
  if (!response.ok())
    return Result<std::string>::failure(
        expectOk(response, "failed to download " + what));
  // OGC services report errors with 200 and an exception document
  if (response.body.find("ExceptionReport") != std::string::npos ||
      response.body.find("ServiceException") != std::string::npos) {
    return Result<std::string>::failure("failed to download " + what + ": " +
                                        response.body);
  }
  return Result<std::string>::success(std::move(response.body));
}

// ===== Listings =====

Result<std::vector<ResourceItem>> GeoServerClient::listWorkspaces() {
  return list("/workspaces", "workspaces", "workspace", "workspaces");
}

Result<std::vector<ResourceItem>>
GeoServerClient::listDataStores(const std::string &workspace) {
  auto stores = list(workspacePath(workspace) + "/datastores", "dataStores",
                     "dataStore", "datastores");
  if (!stores)
    return stores;

  // The listing omits the enabled flag
  for (auto &store : stores.value()) {
    auto detail = getDataStoreConfig(workspace, store.name);
    if (detail)
      store.enabled = detail.value().enabled;
  }
  return stores;
}

Result<std::vector<ResourceItem>>
GeoServerClient::listCoverageStores(const std::string &workspace) {
  auto stores = list(workspacePath(workspace) + "/coveragestores",
                     "coverageStores", "coverageStore", "coverage stores");
  if (!stores)
    return stores;

  for (auto &store : stores.value()) {
    auto detail = getCoverageStoreConfig(workspace, store.name);
    if (detail)
      store.enabled = detail.value().enabled;
  }
  return stores;
}

Result<std::vector<ResourceItem>>
GeoServerClient::listStyles(const std::string &workspace) {
  return list(workspacePath(workspace) + "/styles", "styles", "style",
              "styles");
}

Result<std::vector<ResourceItem>>
GeoServerClient::listLayers(const std::string &workspace) {
  return list(workspacePath(workspace) + "/layers", "layers", "layer",
              "layers");
}

Result<std::vector<ResourceItem>>
GeoServerClient::listLayerGroups(const std::string &workspace) {
  return list(workspacePath(workspace) + "/layergroups", "layerGroups",
              "layerGroup", "layer groups");
}

// ===== Workspaces =====

Status GeoServerClient::createWorkspace(const WorkspaceConfig &config) {
  auto status = expectOk(send("POST", "/workspaces", workspaceBody(config)),
                         "failed to create workspace");
  if (!status)
    return status;

  // Local service settings are only written when they differ from the
  // global defaults
  const std::pair<const char *, bool> services[] = {{"wms", config.wms},
                                                    {"wfs", config.wfs},
                                                    {"wcs", config.wcs},
                                                    {"wmts", config.wmts}};
  for (const auto &[service, enabled] : services) {
    if (enabled)
      continue;
    auto path = "/services/" + std::string(service) + workspacePath(config.name) +
                "/settings";
    auto result = expectOk(send("PUT", path, serviceSettingsBody(service, false)),
                           "failed to configure " + std::string(service));
    if (!result)
      return result;
  }
  return Status::success();
}

Result<WorkspaceConfig>
GeoServerClient::getWorkspaceConfig(const std::string &name) {
  auto response = get(workspacePath(name));
  if (!response.ok())
    return Result<WorkspaceConfig>::failure(
        expectOk(response, "failed to get workspace"));

  auto config = parseWorkspace(response.body);
  if (!config)
    return config;

  auto enabled = [&](const std::string &service) {
    auto settings = get("/services/" + service + workspacePath(name) +
                        "/settings");
    // 404 means the workspace inherits the (enabled) global service
    if (!settings.ok())
      return true;
    return settings.body.find("\"enabled\":false") == std::string::npos;
  };
  config.value().wms = enabled("wms");
  config.value().wfs = enabled("wfs");
  config.value().wcs = enabled("wcs");
  config.value().wmts = enabled("wmts");
  return config;
}

Status GeoServerClient::updateWorkspace(const std::string &name,
                                        const WorkspaceConfig &config) {
  auto status = expectOk(
      send("PUT", workspacePath(name), workspaceBody(config)),
      "failed to update workspace");
  if (!status)
    return status;

  const std::pair<const char *, bool> services[] = {{"wms", config.wms},
                                                    {"wfs", config.wfs},
                                                    {"wcs", config.wcs},
                                                    {"wmts", config.wmts}};
  for (const auto &[service, enabled] : services) {
    auto path = "/services/" + std::string(service) +
                workspacePath(config.name) + "/settings";
    auto result =
        expectOk(send("PUT", path, serviceSettingsBody(service, enabled)),
                 "failed to configure " + std::string(service));
    if (!result)
      return result;
  }
  return Status::success();
}

Status GeoServerClient::deleteWorkspace(const std::string &name) {
  return expectOk(send("DELETE", workspacePath(name) + "?recurse=true", ""),
                  "failed to delete workspace");
}

// ===== Data stores =====

Status GeoServerClient::createDataStore(const DataStoreConfig &config) {
  return expectOk(send("POST", workspacePath(config.workspace) + "/datastores",
                       dataStoreBody(config, true)),
                  "failed to create datastore");
}

Result<DataStoreConfig>
GeoServerClient::getDataStoreConfig(const std::string &workspace,
                                    const std::string &name) {
  auto response = get(workspacePath(workspace) + "/datastores/" +
                      HttpClient::escape(name));
  if (!response.ok())
    return Result<DataStoreConfig>::failure(
        expectOk(response, "failed to get datastore"));
  return parseDataStore(response.body, workspace);
}

Status GeoServerClient::updateDataStore(const std::string &name,
                                        const DataStoreConfig &config) {
  return expectOk(send("PUT",
                       workspacePath(config.workspace) + "/datastores/" +
                           HttpClient::escape(name),
                       dataStoreBody(config, false)),
                  "failed to update datastore");
}

Status GeoServerClient::deleteDataStore(const std::string &workspace,
                                        const std::string &name) {
  return expectOk(send("DELETE",
                       workspacePath(workspace) + "/datastores/" +
                           HttpClient::escape(name) + "?recurse=true",
                       ""),
                  "failed to delete datastore");
}

// ===== Coverage stores =====

Status GeoServerClient::createCoverageStore(const CoverageStoreConfig &config) {
  return expectOk(send("POST",
                       workspacePath(config.workspace) + "/coveragestores",
                       coverageStoreBody(config, true)),
                  "failed to create coverage store");
}

Result<CoverageStoreConfig>
GeoServerClient::getCoverageStoreConfig(const std::string &workspace,
                                        const std::string &name) {
  auto response = get(workspacePath(workspace) + "/coveragestores/" +
                      HttpClient::escape(name));
  if (!response.ok())
    return Result<CoverageStoreConfig>::failure(
        expectOk(response, "failed to get coverage store"));
  return parseCoverageStore(response.body, workspace);
}

Status GeoServerClient::updateCoverageStore(const std::string &name,
                                            const CoverageStoreConfig &config) {
  return expectOk(send("PUT",
                       workspacePath(config.workspace) + "/coveragestores/" +
                           HttpClient::escape(name),
                       coverageStoreBody(config, false)),
                  "failed to update coverage store");
}

Status GeoServerClient::deleteCoverageStore(const std::string &workspace,
                                            const std::string &name) {
  return expectOk(send("DELETE",
                       workspacePath(workspace) + "/coveragestores/" +
                           HttpClient::escape(name) + "?recurse=true",
                       ""),
                  "failed to delete coverage store");
}

// ===== Styles =====

Status GeoServerClient::createStyle(const std::string &workspace,
                                    const StyleContent &style) {
  auto response = m_http.request(
      "POST",
      rest(workspacePath(workspace) + "/styles?name=" +
           HttpClient::escape(style.name)),
      style.body, styleContentType(style.format));
  return expectOk(response, "failed to create style");
}

Result<StyleContent> GeoServerClient::getStyle(const std::string &workspace,
                                               const std::string &name) {
  auto meta = get(workspacePath(workspace) + "/styles/" +
                  HttpClient::escape(name) + ".json");
  if (!meta.ok())
    return Result<StyleContent>::failure(
        expectOk(meta, "failed to get style"));

  StyleContent style;
  style.name = name;
  style.format = meta.body.find("\"format\":\"css\"") != std::string::npos
                     ? StyleFormat::CSS
                     : StyleFormat::SLD;

  auto body = m_http.request("GET",
                             rest(workspacePath(workspace) + "/styles/" +
                                  HttpClient::escape(name) + "." +
                                  toString(style.format)),
                             "", "", "");
  if (!body.ok())
    return Result<StyleContent>::failure(
        expectOk(body, "failed to get style content"));
  style.body = std::move(body.body);
  return Result<StyleContent>::success(style);
}

Status GeoServerClient::updateStyle(const std::string &workspace,
                                    const StyleContent &style) {
  auto response = m_http.request("PUT",
                                 rest(workspacePath(workspace) + "/styles/" +
                                      HttpClient::escape(style.name) +
                                      "?raw=true"),
                                 style.body, styleContentType(style.format));
  return expectOk(response, "failed to update style");
}

Status GeoServerClient::deleteStyle(const std::string &workspace,
                                    const std::string &name) {
  return expectOk(send("DELETE",
                       workspacePath(workspace) + "/styles/" +
                           HttpClient::escape(name) + "?purge=true",
                       ""),
                  "failed to delete style");
}

// ===== Layers =====

Result<LayerConfig> GeoServerClient::getLayerConfig(const std::string &workspace,
                                                    const std::string &name) {
  auto response =
      get(workspacePath(workspace) + "/layers/" + HttpClient::escape(name));
  if (!response.ok())
    return Result<LayerConfig>::failure(
        expectOk(response, "failed to get layer"));

  auto config = parseLayer(response.body, workspace);
  if (!config || config.value().store.empty())
    return config;

  // Bounds live on the feature type / coverage, not on the layer
  bool coverage = config.value().storeType == "coverageStore";
  auto resource =
      get(workspacePath(workspace) +
          (coverage ? "/coveragestores/" : "/datastores/") +
          HttpClient::escape(config.value().store) +
          (coverage ? "/coverages/" : "/featuretypes/") +
          HttpClient::escape(name));
  if (resource.ok())
    config.value().bounds = parseResourceBounds(resource.body);
  return config;
}

Status GeoServerClient::updateLayer(const LayerConfig &config) {
  return expectOk(send("PUT",
                       workspacePath(config.workspace) + "/layers/" +
                           HttpClient::escape(config.name),
                       layerBody(config)),
                  "failed to update layer");
}

Status GeoServerClient::deleteLayer(const std::string &workspace,
                                    const std::string &name) {
  return expectOk(send("DELETE",
                       workspacePath(workspace) + "/layers/" +
                           HttpClient::escape(name) + "?recurse=true",
                       ""),
                  "failed to delete layer");
}

Status GeoServerClient::publishFromStore(const std::string &workspace,
                                         const std::string &store,
                                         bool coverage) {
  auto existing = getLayerConfig(workspace, store);
  if (existing) {
    LayerConfig config = existing.value();
    config.enabled = true;
    return updateLayer(config);
  }

  std::string path = workspacePath(workspace) +
                     (coverage ? "/coveragestores/" : "/datastores/") +
                     HttpClient::escape(store) +
                     (coverage ? "/coverages" : "/featuretypes");
  nlohmann::json resource = {
      {"name", store}, {"nativeName", store}, {"enabled", true}};
  nlohmann::json body = {{coverage ? "coverage" : "featureType", resource}};
  return expectOk(send("POST", path, body.dump()), "failed to publish layer");
}

// ===== Layer groups =====

Status GeoServerClient::createLayerGroup(const LayerGroupConfig &config) {
  return expectOk(send("POST",
                       workspacePath(config.workspace) + "/layergroups",
                       layerGroupBody(config)),
                  "failed to create layer group");
}

Result<LayerGroupConfig>
GeoServerClient::getLayerGroup(const std::string &workspace,
                               const std::string &name) {
  auto response = get(workspacePath(workspace) + "/layergroups/" +
                      HttpClient::escape(name));
  if (!response.ok())
    return Result<LayerGroupConfig>::failure(
        expectOk(response, "failed to get layer group"));
  return parseLayerGroup(response.body, workspace);
}

Status GeoServerClient::updateLayerGroup(const std::string &name,
                                         const LayerGroupConfig &config) {
  return expectOk(send("PUT",
                       workspacePath(config.workspace) + "/layergroups/" +
                           HttpClient::escape(name),
                       layerGroupBody(config)),
                  "failed to update layer group");
}

Status GeoServerClient::deleteLayerGroup(const std::string &workspace,
                                         const std::string &name) {
  return expectOk(send("DELETE",
                       workspacePath(workspace) + "/layergroups/" +
                           HttpClient::escape(name),
                       ""),
                  "failed to delete layer group");
}

// ===== Settings =====

Result<ContactInfo> GeoServerClient::getContact() {
  auto response = get("/settings/contact");
  if (!response.ok())
    return Result<ContactInfo>::failure(
        expectOk(response, "failed to get contact information"));
  return parseContact(response.body);
}

Status GeoServerClient::updateContact(const ContactInfo &contact) {
  return expectOk(send("PUT", "/settings/contact", contactBody(contact)),
                  "failed to update contact information");
}

// ===== Uploads =====

Status GeoServerClient::uploadFile(const std::string &workspace,
                                   const std::string &storeName,
                                   const std::string &localPath,
                                   FileType type) {
  namespace fs = std::filesystem;
  std::string ws = workspacePath(workspace);
  std::string store = HttpClient::escape(storeName);

  switch (type) {
  case FileType::Shapefile: {
    std::string archive = localPath;
    bool temporary = false;
    if (toLower(fs::path(localPath).extension().string()) == ".shp") {
      auto bundled = bundleShapefile(localPath);
      if (!bundled)
        return bundled.status();
      archive = bundled.value();
      temporary = true;
    }
    auto response = m_http.putFile(
        rest(ws + "/datastores/" + store + "/file.shp"), archive,
        "application/zip");
    if (temporary) {
      std::error_code ec;
      fs::remove(archive, ec);
    }
    return expectOk(response, "upload failed");
  }
  case FileType::GeoTIFF:
    return expectOk(m_http.putFile(rest(ws + "/coveragestores/" + store +
                                        "/file.geotiff"),
                                   localPath, "image/tiff"),
                    "upload failed");
  case FileType::GeoPackage:
    return expectOk(m_http.putFile(rest(ws + "/datastores/" + store +
                                        "/file.gpkg"),
                                   localPath,
                                   "application/geopackage+sqlite3"),
                    "upload failed");
  case FileType::SLD:
  case FileType::CSS: {
    std::error_code ec;
    auto size = fs::file_size(localPath, ec);
    if (ec)
      return Status::failure("failed to read " + localPath + ": " +
                             ec.message());
    std::string body(size, '\0');
    FILE *f = fopen(localPath.c_str(), "rb");
    if (!f)
      return Status::failure("failed to open file " + localPath);
    size_t read = fread(body.data(), 1, body.size(), f);
    fclose(f);
    body.resize(read);

    StyleContent style;
    style.name = storeName;
    style.format = type == FileType::CSS ? StyleFormat::CSS : StyleFormat::SLD;
    style.body = std::move(body);
    return createStyle(workspace, style);
  }
  default:
    return Status::failure("unsupported file type for upload: " + localPath);
  }
}

// ===== Downloads =====

Result<std::string> GeoServerClient::downloadLayer(const std::string &workspace,
                                                   const std::string &name) {
  std::string url = m_base_url + "/" + HttpClient::escape(workspace) +
                    "/ows?service=WFS&version=1.0.0&request=GetFeature"
                    "&outputFormat=SHAPE-ZIP&typeName=" +
                    HttpClient::escape(workspace + ":" + name);
  return download(url, "layer " + name);
}

Result<std::string>
GeoServerClient::downloadCoverage(const std::string &workspace,
                                  const std::string &store) {
  std::string url = m_base_url + "/" + HttpClient::escape(workspace) +
                    "/ows?service=WCS&version=2.0.1&request=GetCoverage"
                    "&format=image/geotiff&coverageId=" +
                    HttpClient::escape(workspace + "__" + store);
  return download(url, "coverage " + store);
}

Result<std::string> GeoServerClient::downloadStyle(const std::string &workspace,
                                                   const std::string &name) {
  auto style = getStyle(workspace, name);
  if (!style)
    return Result<std::string>::failure(style.error());
  return Result<std::string>::success(style.value().body);
}

// ===== Status =====

Result<ServerStatus> GeoServerClient::fetchStatus() {
  ServerStatus status;
  status.url = m_base_url;

  auto version = get("/about/version");
  if (!version.ok())
    return Result<ServerStatus>::failure(
        expectOk(version, "server unreachable"));

  auto parsed = parseVersion(version.body);
  status.version = parsed ? parsed.value() : "unknown";
  status.online = true;
  status.responseTimeMs = version.latency_ms;

  auto system = get("/about/system-status");
  if (system.ok())
    parseSystemStatus(system.body, status);

  auto workspaces = listWorkspaces();
  if (workspaces) {
    status.workspaceCount = static_cast<int>(workspaces.value().size());
    for (const auto &ws : workspaces.value()) {
      auto stores = list(workspacePath(ws.name) + "/datastores", "dataStores",
                         "dataStore", "datastores");
      if (stores)
        status.dataStoreCount += static_cast<int>(stores.value().size());
    }
  }
  auto layers = list("/layers", "layers", "layer", "layers");
  if (layers)
    status.layerCount = static_cast<int>(layers.value().size());
  auto styles = list("/styles", "styles", "style", "styles");
  if (styles)
    status.styleCount = static_cast<int>(styles.value().size());

  return Result<ServerStatus>::success(status);
}

// ===== Tile cache =====

Result<GwcLayer> GeoServerClient::getGwcLayer(const std::string &layer) {
  auto response = m_http.request(
      "GET", gwc("/layers/" + HttpClient::escape(layer) + ".json"));
  if (!response.ok())
    return Result<GwcLayer>::failure(
        expectOk(response, "failed to get tile layer"));
  return parseGwcLayer(response.body);
}

Status GeoServerClient::seedLayer(const std::string &layer,
                                  const GwcSeedRequest &request) {
  auto response = m_http.request(
      "POST", gwc("/seed/" + HttpClient::escape(layer) + ".json"),
      gwcSeedBody(layer, request), "application/json");
  return expectOk(response, "failed to start " + request.type + " task");
}

Status GeoServerClient::truncateLayer(const std::string &layer,
                                      const GwcSeedRequest &request) {
  GwcSeedRequest truncate = request;
  truncate.type = "truncate";
  truncate.threadCount = 1;
  return seedLayer(layer, truncate);
}

Result<FeatureSummary>
GeoServerClient::describeLayer(const std::string &workspace,
                               const std::string &layer) {
  std::string ows = m_base_url + "/" + HttpClient::escape(workspace) + "/ows";
  std::string type_name = HttpClient::escape(workspace + ":" + layer);

  auto describe = m_http.request(
      "GET",
      ows + "?service=WFS&version=2.0.0&request=DescribeFeatureType"
            "&outputFormat=application/json&typeNames=" +
          type_name,
      "", "", "");
  if (!describe.ok())
    return Result<FeatureSummary>::failure(
        expectOk(describe, "failed to describe layer"));

  auto summary = parseDescribeFeatureType(describe.body);
  if (!summary)
    return summary;

  auto hits = m_http.request(
      "GET",
      ows + "?service=WFS&version=2.0.0&request=GetFeature&resultType=hits"
            "&typeNames=" +
          type_name,
      "", "", "");
  if (!hits.ok())
    return Result<FeatureSummary>::failure(
        expectOk(hits, "failed to count features"));

  auto count = parseFeatureHits(hits.body);
  if (!count)
    return Result<FeatureSummary>::failure(count.error());
  summary.value().featureCount = count.value();
  summary.value().layerName = layer;
  return summary;
}

#include "geoserverjson.hpp"

#include <regex>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

// GeoServer collapses one-element lists into a bare object
std::vector<json> asArray(const json &node) {
  std::vector<json> items;
  if (node.is_array()) {
    for (const auto &item : node)
      items.push_back(item);
  } else if (node.is_object()) {
    items.push_back(node);
  }
  return items;
}

std::string str(const json &node, const char *key,
                const std::string &fallback = "") {
  auto it = node.find(key);
  if (it == node.end() || it->is_null())
    return fallback;
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

bool flag(const json &node, const char *key, bool fallback) {
  auto it = node.find(key);
  if (it == node.end())
    return fallback;
  if (it->is_boolean())
    return it->get<bool>();
  if (it->is_string())
    return it->get<std::string>() == "true";
  return fallback;
}

double number(const json &node, const char *key) {
  auto it = node.find(key);
  if (it == node.end())
    return 0.0;
  if (it->is_number())
    return it->get<double>();
  if (it->is_string()) {
    try {
      return std::stod(it->get<std::string>());
    } catch (const std::exception &) {
      return 0.0;
    }
  }
  return 0.0;
}

BoundingBox parseBox(const json &node) {
  BoundingBox box;
  if (!node.is_object())
    return box;
  box.minx = number(node, "minx");
  box.miny = number(node, "miny");
  box.maxx = number(node, "maxx");
  box.maxy = number(node, "maxy");
  auto crs = node.find("crs");
  if (crs != node.end()) {
    box.crs = crs->is_object() ? str(*crs, "$") : crs->get<std::string>();
  }
  box.valid = box.maxx > box.minx || box.maxy > box.miny;
  return box;
}

// "ws:name" -> "name"
std::string stripWorkspace(const std::string &qualified) {
  auto pos = qualified.find(':');
  return pos == std::string::npos ? qualified : qualified.substr(pos + 1);
}

std::string qualify(const std::string &workspace, const std::string &name) {
  if (workspace.empty() || name.find(':') != std::string::npos)
    return name;
  return workspace + ":" + name;
}

// ".../datastores/<store>/featuretypes/..." -> store
std::string storeFromHref(const std::string &href, std::string &type) {
  static const std::regex pattern(
      R"(/(datastores|coveragestores)/([^/]+)/)");
  std::smatch match;
  if (std::regex_search(href, match, pattern)) {
    type = match[1] == "datastores" ? "dataStore" : "coverageStore";
    return match[2];
  }
  return "";
}

template <typename T, typename Fn>
Result<T> parseWith(const std::string &body, const std::string &what, Fn fn) {
  try {
    return Result<T>::success(fn(json::parse(body)));
  } catch (const json::exception &e) {
    return Result<T>::failure("failed to decode " + what + ": " + e.what());
  }
}

} // namespace

std::string toString(DataStoreKind kind) {
  switch (kind) {
  case DataStoreKind::Directory:
    return "Directory of spatial files (shapefiles)";
  case DataStoreKind::GeoPackage:
    return "GeoPackage";
  case DataStoreKind::PostGIS:
    return "PostGIS";
  case DataStoreKind::WFS:
    return "Web Feature Server (NG)";
  }
  return "";
}

std::string toString(CoverageStoreKind kind) {
  switch (kind) {
  case CoverageStoreKind::GeoTIFF:
    return "GeoTIFF";
  case CoverageStoreKind::WorldImage:
    return "WorldImage";
  case CoverageStoreKind::ImageMosaic:
    return "ImageMosaic";
  }
  return "";
}

std::string toString(StyleFormat format) {
  return format == StyleFormat::CSS ? "css" : "sld";
}

Result<std::vector<ResourceItem>> parseNamedList(const std::string &body,
                                                 const std::string &outer,
                                                 const std::string &inner) {
  return parseWith<std::vector<ResourceItem>>(
      body, outer, [&](const json &root) {
        std::vector<ResourceItem> items;
        auto collection = root.find(outer);
        // {"workspaces": ""} means no entries
        if (collection == root.end() || !collection->is_object())
          return items;
        auto list = collection->find(inner);
        if (list == collection->end())
          return items;
        for (const auto &entry : asArray(*list)) {
          ResourceItem item;
          item.name = stripWorkspace(str(entry, "name"));
          if (entry.contains("enabled"))
            item.enabled = flag(entry, "enabled", true);
          items.push_back(item);
        }
        return items;
      });
}

Result<WorkspaceConfig> parseWorkspace(const std::string &body) {
  return parseWith<WorkspaceConfig>(body, "workspace", [](const json &root) {
    const json &ws = root.at("workspace");
    WorkspaceConfig config;
    config.name = str(ws, "name");
    config.isolated = flag(ws, "isolated", false);
    return config;
  });
}

std::string workspaceBody(const WorkspaceConfig &config) {
  json body = {{"workspace",
                {{"name", config.name}, {"isolated", config.isolated}}}};
  return body.dump();
}

std::string serviceSettingsBody(const std::string &service, bool enabled) {
  json body = {{service, {{"enabled", enabled}}}};
  return body.dump();
}

Result<DataStoreConfig> parseDataStore(const std::string &body,
                                       const std::string &workspace) {
  return parseWith<DataStoreConfig>(body, "data store", [&](const json &root) {
    const json &ds = root.at("dataStore");
    DataStoreConfig config;
    config.name = str(ds, "name");
    config.workspace = workspace;
    config.description = str(ds, "description");
    config.enabled = flag(ds, "enabled", true);

    std::string type = str(ds, "type");
    if (type == "PostGIS" || type == "PostGIS (JNDI)")
      config.kind = DataStoreKind::PostGIS;
    else if (type == "GeoPackage")
      config.kind = DataStoreKind::GeoPackage;
    else if (type.find("Web Feature Server") != std::string::npos)
      config.kind = DataStoreKind::WFS;
    else
      config.kind = DataStoreKind::Directory;

    auto params = ds.find("connectionParameters");
    if (params != ds.end() && params->is_object() &&
        params->contains("entry")) {
      for (const auto &entry : asArray(params->at("entry"))) {
        config.params[str(entry, "@key")] = str(entry, "$");
      }
    }
    return config;
  });
}

std::string dataStoreBody(const DataStoreConfig &config, bool with_params) {
  json ds = {{"name", config.name},
             {"description", config.description},
             {"enabled", config.enabled}};

  if (with_params) {
    json entries = json::array();
    if (config.kind == DataStoreKind::PostGIS)
      entries.push_back({{"@key", "dbtype"}, {"$", "postgis"}});
    if (config.kind == DataStoreKind::GeoPackage)
      entries.push_back({{"@key", "dbtype"}, {"$", "geopkg"}});
    for (const auto &[key, value] : config.params) {
      if (!value.empty())
        entries.push_back({{"@key", key}, {"$", value}});
    }
    ds["connectionParameters"] = {{"entry", entries}};
  }
  return json{{"dataStore", ds}}.dump();
}

Result<CoverageStoreConfig> parseCoverageStore(const std::string &body,
                                               const std::string &workspace) {
  return parseWith<CoverageStoreConfig>(
      body, "coverage store", [&](const json &root) {
        const json &cs = root.at("coverageStore");
        CoverageStoreConfig config;
        config.name = str(cs, "name");
        config.workspace = workspace;
        config.description = str(cs, "description");
        config.enabled = flag(cs, "enabled", true);
        config.url = str(cs, "url");
        std::string type = str(cs, "type");
        if (type == "WorldImage")
          config.kind = CoverageStoreKind::WorldImage;
        else if (type == "ImageMosaic")
          config.kind = CoverageStoreKind::ImageMosaic;
        else
          config.kind = CoverageStoreKind::GeoTIFF;
        return config;
      });
}

std::string coverageStoreBody(const CoverageStoreConfig &config,
                              bool with_url) {
  json cs = {{"name", config.name},
             {"description", config.description},
             {"enabled", config.enabled}};
  if (with_url) {
    cs["type"] = toString(config.kind);
    cs["url"] = config.url;
    cs["workspace"] = config.workspace;
  }
  return json{{"coverageStore", cs}}.dump();
}

Result<LayerConfig> parseLayer(const std::string &body,
                               const std::string &workspace) {
  return parseWith<LayerConfig>(body, "layer", [&](const json &root) {
    const json &layer = root.at("layer");
    LayerConfig config;
    config.name = stripWorkspace(str(layer, "name"));
    config.workspace = workspace;
    config.enabled = flag(layer, "enabled", true);
    config.advertised = flag(layer, "advertised", true);
    config.queryable = flag(layer, "queryable", true);

    auto def = layer.find("defaultStyle");
    if (def != layer.end() && def->is_object())
      config.defaultStyle = stripWorkspace(str(*def, "name"));

    auto styles = layer.find("styles");
    if (styles != layer.end() && styles->is_object() &&
        styles->contains("style")) {
      for (const auto &style : asArray(styles->at("style")))
        config.styles.push_back(stripWorkspace(str(style, "name")));
    }

    auto resource = layer.find("resource");
    if (resource != layer.end() && resource->is_object()) {
      config.store = storeFromHref(str(*resource, "href"), config.storeType);
    }
    return config;
  });
}

std::string layerBody(const LayerConfig &config) {
  json layer = {{"enabled", config.enabled},
                {"advertised", config.advertised},
                {"queryable", config.queryable}};
  if (!config.defaultStyle.empty())
    layer["defaultStyle"] = {{"name", config.defaultStyle}};
  return json{{"layer", layer}}.dump();
}

BoundingBox parseResourceBounds(const std::string &body) {
  try {
    json root = json::parse(body);
    for (const char *key : {"featureType", "coverage"}) {
      auto res = root.find(key);
      if (res == root.end())
        continue;
      auto latlon = res->find("latLonBoundingBox");
      if (latlon != res->end())
        return parseBox(*latlon);
      auto native = res->find("nativeBoundingBox");
      if (native != res->end())
        return parseBox(*native);
    }
  } catch (const json::exception &) {
    // no bounds available
  }
  return BoundingBox{};
}

Result<LayerGroupConfig> parseLayerGroup(const std::string &body,
                                         const std::string &workspace) {
  return parseWith<LayerGroupConfig>(
      body, "layer group", [&](const json &root) {
        const json &group = root.at("layerGroup");
        LayerGroupConfig config;
        config.name = str(group, "name");
        config.workspace = workspace;
        config.title = str(group, "title");
        config.mode = str(group, "mode", "SINGLE");

        auto publishables = group.find("publishables");
        if (publishables != group.end() && publishables->is_object() &&
            publishables->contains("published")) {
          for (const auto &p : asArray(publishables->at("published")))
            config.layers.push_back(stripWorkspace(str(p, "name")));
        }
        auto styles = group.find("styles");
        if (styles != group.end() && styles->is_object() &&
            styles->contains("style")) {
          for (const auto &s : asArray(styles->at("style")))
            config.styles.push_back(
                s.is_object() ? stripWorkspace(str(s, "name")) : "");
        }
        auto bounds = group.find("bounds");
        if (bounds != group.end())
          config.bounds = parseBox(*bounds);
        return config;
      });
}

std::string layerGroupBody(const LayerGroupConfig &config) {
  json published = json::array();
  json styles = json::array();
  for (const auto &layer : config.layers) {
    published.push_back(
        {{"@type", "layer"}, {"name", qualify(config.workspace, layer)}});
    styles.push_back("");
  }

  json group = {{"name", config.name},
                {"mode", config.mode},
                {"title", config.title},
                {"publishables", {{"published", published}}},
                {"styles", {{"style", styles}}}};
  if (!config.workspace.empty())
    group["workspace"] = {{"name", config.workspace}};
  return json{{"layerGroup", group}}.dump();
}

Result<ContactInfo> parseContact(const std::string &body) {
  return parseWith<ContactInfo>(body, "contact", [](const json &root) {
    const json &c = root.at("contact");
    ContactInfo info;
    info.person = str(c, "contactPerson");
    info.position = str(c, "contactPosition");
    info.organization = str(c, "contactOrganization");
    info.email = str(c, "contactEmail");
    info.phone = str(c, "contactVoice");
    info.address = str(c, "address");
    info.city = str(c, "addressCity");
    info.country = str(c, "addressCountry");
    return info;
  });
}

std::string contactBody(const ContactInfo &contact) {
  json c = {{"contactPerson", contact.person},
            {"contactPosition", contact.position},
            {"contactOrganization", contact.organization},
            {"contactEmail", contact.email},
            {"contactVoice", contact.phone},
            {"address", contact.address},
            {"addressCity", contact.city},
            {"addressCountry", contact.country}};
  return json{{"contact", c}}.dump();
}

Result<GwcLayer> parseGwcLayer(const std::string &body) {
  return parseWith<GwcLayer>(body, "tile layer", [](const json &root) {
    const json &layer = root.at("GeoServerLayer");
    GwcLayer config;
    config.name = str(layer, "name");
    config.enabled = flag(layer, "enabled", true);
    auto subsets = layer.find("gridSubsets");
    if (subsets != layer.end()) {
      for (const auto &subset : asArray(*subsets)) {
        std::string grid = str(subset, "gridSetName");
        if (!grid.empty())
          config.gridSubsets.push_back(grid);
      }
    }
    auto formats = layer.find("mimeFormats");
    if (formats != layer.end()) {
      for (const auto &format : asArray(*formats)) {
        if (format.is_string())
          config.mimeFormats.push_back(format.get<std::string>());
      }
    }
    return config;
  });
}

std::string gwcSeedBody(const std::string &layer,
                        const GwcSeedRequest &request) {
  json seed = {{"name", layer},
               {"gridSetId", request.gridSetId},
               {"zoomStart", request.zoomStart},
               {"zoomStop", request.zoomStop},
               {"format", request.format},
               {"type", request.type},
               {"threadCount", request.threadCount}};
  return json{{"seedRequest", seed}}.dump();
}

Result<std::string> parseVersion(const std::string &body) {
  return parseWith<std::string>(body, "version", [](const json &root) {
    for (const auto &res : asArray(root.at("about").at("resource"))) {
      if (str(res, "@name") == "GeoServer")
        return str(res, "Version");
    }
    return std::string("unknown");
  });
}

void parseSystemStatus(const std::string &body, ServerStatus &status) {
  try {
    json root = json::parse(body);
    for (const auto &metric : asArray(root.at("metrics").at("metric"))) {
      std::string name = str(metric, "name");
      if (name == "MEMORY_USED")
        status.memoryUsed = static_cast<int64_t>(number(metric, "value"));
      else if (name == "MEMORY_TOTAL")
        status.memoryTotal = static_cast<int64_t>(number(metric, "value"));
    }
    if (status.memoryTotal > 0) {
      status.memoryUsedPct = 100.0 * static_cast<double>(status.memoryUsed) /
                             static_cast<double>(status.memoryTotal);
    }
  } catch (const json::exception &) {
    // memory figures are optional; older servers lack the endpoint
  }
}

Result<FeatureSummary> parseDescribeFeatureType(const std::string &body) {
  return parseWith<FeatureSummary>(
      body, "feature type", [](const json &root) {
        FeatureSummary summary;
        const auto types = asArray(root.at("featureTypes"));
        if (types.empty())
          return summary;
        const json &type = types.front();
        summary.layerName = stripWorkspace(str(type, "typeName"));
        for (const auto &prop : asArray(type.at("properties"))) {
          std::string declared = str(prop, "type");
          if (declared.rfind("gml:", 0) == 0) {
            summary.geometryType = str(prop, "localType");
          } else {
            summary.attributes.push_back(str(prop, "name"));
          }
        }
        return summary;
      });
}

Result<int64_t> parseFeatureHits(const std::string &body) {
  static const std::regex pattern(
      R"#((numberMatched|numberOfFeatures)="(\d+)")#");
  std::smatch match;
  if (std::regex_search(body, match, pattern))
    return Result<int64_t>::success(std::stoll(match[2]));
  return Result<int64_t>::failure("feature count missing in WFS response");
}

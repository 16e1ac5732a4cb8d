#include "crudforms.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

#include "resourcetree.hpp"
#include "utils.hpp"

namespace {

FieldSpec textField(std::string key, std::string label, std::string value = "",
                    bool required = false) {
  FieldSpec field;
  field.key = std::move(key);
  field.label = std::move(label);
  field.value = std::move(value);
  field.required = required;
  return field;
}

FieldSpec toggleField(std::string key, std::string label, bool value) {
  FieldSpec field = textField(std::move(key), std::move(label));
  field.kind = FieldKind::Toggle;
  field.value = value ? "true" : "false";
  return field;
}

FieldSpec choiceField(std::string key, std::string label,
                      std::vector<std::string> options, std::string value) {
  FieldSpec field = textField(std::move(key), std::move(label));
  field.kind = FieldKind::Choice;
  field.options = std::move(options);
  field.value = value.empty() && !field.options.empty() ? field.options.front()
                                                        : std::move(value);
  return field;
}

FieldSpec readOnlyField(std::string key, std::string label, std::string value) {
  FieldSpec field = textField(std::move(key), std::move(label), std::move(value));
  field.kind = FieldKind::ReadOnly;
  return field;
}

FieldSpec onlyFor(FieldSpec field, const std::string &key,
                  std::vector<std::string> values) {
  field.showIf = {key, std::move(values)};
  return field;
}

// Short labels offered in the store type choices

const std::vector<std::string> kDataStoreTypes = {"Directory", "GeoPackage",
                                                  "PostGIS", "WFS"};
const std::vector<std::string> kCoverageStoreTypes = {"GeoTIFF", "WorldImage",
                                                      "ImageMosaic"};
const std::vector<std::string> kStyleFormats = {"SLD", "CSS"};
const std::vector<std::string> kGroupModes = {"SINGLE", "NAMED", "CONTAINER",
                                              "EO"};

// Offered when the server does not report the layer's tile settings
const std::vector<std::string> kGridSets = {"EPSG:4326", "EPSG:900913",
                                            "EPSG:3857"};
const std::vector<std::string> kTileFormats = {"image/png", "image/jpeg",
                                               "image/png8"};
const std::vector<std::string> kTileOperations = {"seed", "reseed",
                                                  "truncate"};
constexpr int kMaxZoom = 25;
constexpr int kMaxSeedThreads = 16;

std::string dataStoreTypeLabel(DataStoreKind kind) {
  return kDataStoreTypes[static_cast<size_t>(kind)];
}

DataStoreKind dataStoreKindFromLabel(const std::string &label) {
  for (size_t i = 0; i < kDataStoreTypes.size(); ++i) {
    if (kDataStoreTypes[i] == label)
      return static_cast<DataStoreKind>(i);
  }
  return DataStoreKind::Directory;
}

CoverageStoreKind coverageKindFromLabel(const std::string &label) {
  for (size_t i = 0; i < kCoverageStoreTypes.size(); ++i) {
    if (kCoverageStoreTypes[i] == label)
      return static_cast<CoverageStoreKind>(i);
  }
  return CoverageStoreKind::GeoTIFF;
}

StyleFormat styleFormatFromLabel(const std::string &label) {
  return label == "CSS" ? StyleFormat::CSS : StyleFormat::SLD;
}

Result<std::string> readLocalFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return Result<std::string>::failure("cannot read " + path);
  std::ostringstream content;
  content << in.rdbuf();
  return Result<std::string>::success(content.str());
}

std::vector<std::string> names(const std::vector<ResourceItem> &items) {
  std::vector<std::string> out;
  for (const auto &item : items)
    out.push_back(item.name);
  return out;
}

// Workspace

WizardSpec workspaceForm(const WorkspaceConfig &config, bool create) {
  WizardSpec spec;
  spec.title = create ? "Create workspace" : "Edit workspace";
  spec.steps.push_back(
      {"Workspace",
       {textField("name", "Name", config.name, true),
        toggleField("isolated", "Isolated", config.isolated),
        toggleField("enabled", "Enabled", config.enabled)}});
  spec.steps.push_back({"Services",
                        {toggleField("wms", "WMS", config.wms),
                         toggleField("wfs", "WFS", config.wfs),
                         toggleField("wcs", "WCS", config.wcs),
                         toggleField("wmts", "WMTS", config.wmts),
                         toggleField("wps", "WPS", config.wps)}});
  return spec;
}

WorkspaceConfig workspaceFromForm(const FormValues &values) {
  WorkspaceConfig config;
  config.name = trim(valueOf(values, "name"));
  config.isolated = isTrue(values, "isolated");
  config.enabled = isTrue(values, "enabled");
  config.wms = isTrue(values, "wms");
  config.wfs = isTrue(values, "wfs");
  config.wcs = isTrue(values, "wcs");
  config.wmts = isTrue(values, "wmts");
  config.wps = isTrue(values, "wps");
  return config;
}

// Data store

WizardSpec dataStoreCreateForm() {
  WizardSpec spec;
  spec.title = "Create data store";
  spec.steps.push_back(
      {"Data store",
       {textField("name", "Name", "", true),
        choiceField("type", "Type", kDataStoreTypes, "Directory"),
        textField("description", "Description"),
        toggleField("enabled", "Enabled", true)}});

  const std::string type = "type";
  spec.steps.push_back(
      {"Connection",
       {onlyFor(textField("dir.url", "Directory (file:...)"), type,
                {"Directory"}),
        onlyFor(textField("gpkg.database", "GeoPackage file"), type,
                {"GeoPackage"}),
        onlyFor(textField("pg.host", "Host", "localhost"), type, {"PostGIS"}),
        onlyFor(textField("pg.port", "Port", "5432"), type, {"PostGIS"}),
        onlyFor(textField("pg.database", "Database"), type, {"PostGIS"}),
        onlyFor(textField("pg.schema", "Schema", "public"), type, {"PostGIS"}),
        onlyFor(textField("pg.user", "User"), type, {"PostGIS"}),
        [&] {
          FieldSpec field =
              onlyFor(textField("pg.passwd", "Password"), type, {"PostGIS"});
          field.kind = FieldKind::Secret;
          return field;
        }(),
        onlyFor(textField("wfs.url", "Capabilities URL"), type, {"WFS"})}});
  return spec;
}

WizardSpec dataStoreEditForm(const DataStoreConfig &config) {
  WizardSpec spec;
  spec.title = "Edit data store";
  spec.steps.push_back(
      {"Data store",
       {textField("name", "Name", config.name, true),
        readOnlyField("type", "Type", dataStoreTypeLabel(config.kind)),
        textField("description", "Description", config.description),
        toggleField("enabled", "Enabled", config.enabled)}});
  return spec;
}

DataStoreConfig dataStoreFromForm(const CrudRequest &request,
                                  const FormValues &values) {
  DataStoreConfig config;
  config.name = trim(valueOf(values, "name"));
  config.workspace = request.workspace;
  config.description = valueOf(values, "description");
  config.enabled = isTrue(values, "enabled");
  config.kind = dataStoreKindFromLabel(valueOf(values, "type"));

  switch (config.kind) {
  case DataStoreKind::Directory:
    config.params["url"] = valueOf(values, "dir.url");
    break;
  case DataStoreKind::GeoPackage:
    config.params["database"] = valueOf(values, "gpkg.database");
    break;
  case DataStoreKind::PostGIS:
    for (const char *key : {"host", "port", "database", "schema", "user",
                            "passwd"})
      config.params[key] = valueOf(values, std::string("pg.") + key);
    break;
  case DataStoreKind::WFS:
    config.params["WFSDataStoreFactory:GET_CAPABILITIES_URL"] =
        valueOf(values, "wfs.url");
    break;
  }
  return config;
}

// Coverage store

WizardSpec coverageStoreForm(const CoverageStoreConfig &config, bool create) {
  WizardSpec spec;
  spec.title = create ? "Create coverage store" : "Edit coverage store";
  std::vector<FieldSpec> fields;
  fields.push_back(textField("name", "Name", config.name, true));
  if (create) {
    fields.push_back(choiceField("type", "Type", kCoverageStoreTypes,
                                 toString(config.kind)));
    fields.push_back(textField("url", "File URL (file:...)", config.url, true));
  } else {
    fields.push_back(readOnlyField("type", "Type", toString(config.kind)));
    fields.push_back(readOnlyField("url", "File URL", config.url));
  }
  fields.push_back(textField("description", "Description", config.description));
  fields.push_back(toggleField("enabled", "Enabled", config.enabled));
  spec.steps.push_back({"Coverage store", fields});
  return spec;
}

CoverageStoreConfig coverageStoreFromForm(const CrudRequest &request,
                                          const FormValues &values) {
  CoverageStoreConfig config;
  config.name = trim(valueOf(values, "name"));
  config.workspace = request.workspace;
  config.kind = coverageKindFromLabel(valueOf(values, "type"));
  config.url = trim(valueOf(values, "url"));
  config.description = valueOf(values, "description");
  config.enabled = isTrue(values, "enabled");
  return config;
}

// Style

WizardSpec styleCreateForm() {
  WizardSpec spec;
  spec.title = "Create style";
  spec.steps.push_back(
      {"Style",
       {textField("name", "Name", "", true),
        choiceField("format", "Format", kStyleFormats, "SLD"),
        textField("file", "Local style file", "", true)}});
  return spec;
}

WizardSpec styleEditForm(const StyleContent &style) {
  WizardSpec spec;
  spec.title = "Edit style";
  spec.steps.push_back(
      {"Style",
       {readOnlyField("name", "Name", style.name),
        readOnlyField("format", "Format",
                      style.format == StyleFormat::CSS ? "CSS" : "SLD"),
        readOnlyField("size", "Current size", formatBytes(style.body.size())),
        textField("file", "Replace with local file", "", true)}});
  return spec;
}

// Layer

WizardSpec layerEditForm(const LayerConfig &config,
                         const std::vector<std::string> &styles) {
  std::vector<std::string> options = styles;
  if (!config.defaultStyle.empty() &&
      std::find(options.begin(), options.end(), config.defaultStyle) ==
          options.end())
    options.insert(options.begin(), config.defaultStyle);

  WizardSpec spec;
  spec.title = "Edit layer";
  std::vector<FieldSpec> fields = {
      readOnlyField("name", "Name", config.name),
      readOnlyField("store", "Store", config.store),
      toggleField("enabled", "Enabled", config.enabled),
      toggleField("advertised", "Advertised", config.advertised),
      toggleField("queryable", "Queryable", config.queryable)};
  if (!options.empty())
    fields.push_back(choiceField("defaultStyle", "Default style", options,
                                 config.defaultStyle));
  spec.steps.push_back({"Layer", fields});
  return spec;
}

// Layer group

WizardSpec layerGroupForm(const LayerGroupConfig &config,
                          const std::vector<std::string> &layers, bool create) {
  FieldSpec members = textField("layers", "Layers", joinList(config.layers), true);
  members.kind = FieldKind::MultiChoice;
  members.options = layers;
  for (const auto &layer : config.layers) {
    if (std::find(members.options.begin(), members.options.end(), layer) ==
        members.options.end())
      members.options.push_back(layer);
  }

  WizardSpec spec;
  spec.title = create ? "Create layer group" : "Edit layer group";
  spec.steps.push_back(
      {"Layer group",
       {textField("name", "Name", config.name, true),
        textField("title", "Title", config.title),
        choiceField("mode", "Mode", kGroupModes, config.mode)}});
  spec.steps.push_back({"Members", {members}});
  return spec;
}

LayerGroupConfig layerGroupFromForm(const CrudRequest &request,
                                    const FormValues &values) {
  LayerGroupConfig config;
  config.name = trim(valueOf(values, "name"));
  config.workspace = request.workspace;
  config.title = valueOf(values, "title");
  config.mode = valueOf(values, "mode");
  if (config.mode.empty())
    config.mode = "SINGLE";
  config.layers = splitList(valueOf(values, "layers"));
  return config;
}

// Contact

WizardSpec contactForm(const ContactInfo &contact) {
  WizardSpec spec;
  spec.title = "Edit contact information";
  spec.steps.push_back(
      {"Contact",
       {textField("person", "Person", contact.person),
        textField("position", "Position", contact.position),
        textField("organization", "Organization", contact.organization),
        textField("email", "Email", contact.email)}});
  spec.steps.push_back({"Address",
                        {textField("phone", "Phone", contact.phone),
                         textField("address", "Address", contact.address),
                         textField("city", "City", contact.city),
                         textField("country", "Country", contact.country)}});
  return spec;
}

ContactInfo contactFromForm(const FormValues &values) {
  ContactInfo contact;
  contact.person = valueOf(values, "person");
  contact.position = valueOf(values, "position");
  contact.organization = valueOf(values, "organization");
  contact.email = valueOf(values, "email");
  contact.phone = valueOf(values, "phone");
  contact.address = valueOf(values, "address");
  contact.city = valueOf(values, "city");
  contact.country = valueOf(values, "country");
  return contact;
}

// Tile cache

std::string qualifiedLayer(const CrudRequest &request) {
  return request.workspace + ":" + request.name;
}

WizardSpec tileCacheForm(const std::string &layer, const GwcLayer &config) {
  const auto &grids = config.gridSubsets.empty() ? kGridSets
                                                 : config.gridSubsets;
  const auto &formats = config.mimeFormats.empty() ? kTileFormats
                                                   : config.mimeFormats;
  WizardSpec spec;
  spec.title = "Manage tile cache";
  spec.steps.push_back(
      {"Tile cache",
       {readOnlyField("layer", "Layer", layer),
        choiceField("operation", "Operation", kTileOperations, "seed"),
        choiceField("gridSet", "Grid set", grids, ""),
        choiceField("format", "Format", formats, "")}});
  spec.steps.push_back(
      {"Zoom levels",
       {textField("zoomStart", "Zoom start", "0", true),
        textField("zoomStop", "Zoom stop", "10", true),
        onlyFor(textField("threads", "Threads", "2", true), "operation",
                {"seed", "reseed"})}});
  return spec;
}

std::optional<int> parseCount(const std::string &text) {
  const std::string value = trim(text);
  int out = 0;
  auto [end, ec] =
      std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc() || end != value.data() + value.size() || value.empty())
    return std::nullopt;
  return out;
}

std::string validateTileCache(const FormValues &values) {
  auto start = parseCount(valueOf(values, "zoomStart"));
  auto stop = parseCount(valueOf(values, "zoomStop"));
  if (!start || !stop)
    return "Zoom levels must be whole numbers";
  if (*start < 0 || *stop > kMaxZoom)
    return "Zoom levels range from 0 to " + std::to_string(kMaxZoom);
  if (*start > *stop)
    return "Zoom start must not exceed zoom stop";
  if (valueOf(values, "operation") == "truncate")
    return "";
  auto threads = parseCount(valueOf(values, "threads"));
  if (!threads || *threads < 1 || *threads > kMaxSeedThreads)
    return "Threads must be between 1 and " + std::to_string(kMaxSeedThreads);
  return "";
}

GwcSeedRequest seedFromForm(const FormValues &values) {
  GwcSeedRequest seed;
  seed.type = valueOf(values, "operation");
  if (seed.type.empty())
    seed.type = "seed";
  seed.gridSetId = valueOf(values, "gridSet");
  seed.format = valueOf(values, "format");
  seed.zoomStart = parseCount(valueOf(values, "zoomStart")).value_or(0);
  seed.zoomStop = parseCount(valueOf(values, "zoomStop")).value_or(10);
  seed.threadCount = parseCount(valueOf(values, "threads")).value_or(1);
  return seed;
}

template <typename T, typename Build>
Result<WizardSpec> formFrom(const Result<T> &loaded, Build build) {
  if (!loaded)
    return Result<WizardSpec>::failure(loaded.error());
  return Result<WizardSpec>::success(build(loaded.value()));
}

Status deleteResource(IResourceClient &client, const CrudRequest &request) {
  switch (request.target) {
  case CrudTarget::Workspace:
    return client.deleteWorkspace(request.name);
  case CrudTarget::DataStore:
    return client.deleteDataStore(request.workspace, request.name);
  case CrudTarget::CoverageStore:
    return client.deleteCoverageStore(request.workspace, request.name);
  case CrudTarget::Style:
    return client.deleteStyle(request.workspace, request.name);
  case CrudTarget::Layer:
    return client.deleteLayer(request.workspace, request.name);
  case CrudTarget::LayerGroup:
    return client.deleteLayerGroup(request.workspace, request.name);
  case CrudTarget::Contact:
  case CrudTarget::TileCache:
    break;
  }
  return Status::failure(crudTargetNoun(request.target) +
                         " cannot be deleted");
}

Status replaceStyle(IResourceClient &client, const CrudRequest &request,
                    const FormValues &values, bool create) {
  const std::string path = trim(valueOf(values, "file"));
  auto body = readLocalFile(path);
  if (!body)
    return body.status();

  StyleContent style;
  style.name = create ? trim(valueOf(values, "name")) : request.name;
  style.format = styleFormatFromLabel(valueOf(values, "format"));
  style.body = body.value();
  return create ? client.createStyle(request.workspace, style)
                : client.updateStyle(request.workspace, style);
}

std::optional<std::string> categoryOf(CrudTarget target) {
  switch (target) {
  case CrudTarget::DataStore:
    return categoryTitle(Category::DataStores);
  case CrudTarget::CoverageStore:
    return categoryTitle(Category::CoverageStores);
  case CrudTarget::Style:
    return categoryTitle(Category::Styles);
  case CrudTarget::Layer:
    return categoryTitle(Category::Layers);
  case CrudTarget::LayerGroup:
    return categoryTitle(Category::LayerGroups);
  case CrudTarget::Workspace:
  case CrudTarget::Contact:
  case CrudTarget::TileCache:
    break;
  }
  return std::nullopt;
}

} // namespace

bool needsRemoteState(const CrudRequest &request) {
  if (request.op == CrudOp::Edit)
    return true;
  return request.op == CrudOp::Create &&
         request.target == CrudTarget::LayerGroup;
}

Result<WizardSpec> loadCrudForm(IResourceClient &client,
                                const CrudRequest &request) {
  const bool create = request.op == CrudOp::Create;
  const std::string &ws = request.workspace;

  switch (request.target) {
  case CrudTarget::Workspace:
    if (create)
      return Result<WizardSpec>::success(workspaceForm({}, true));
    return formFrom(client.getWorkspaceConfig(request.name),
                    [](const WorkspaceConfig &c) {
                      return workspaceForm(c, false);
                    });

  case CrudTarget::DataStore:
    if (create)
      return Result<WizardSpec>::success(dataStoreCreateForm());
    return formFrom(client.getDataStoreConfig(ws, request.name),
                    dataStoreEditForm);

  case CrudTarget::CoverageStore:
    if (create)
      return Result<WizardSpec>::success(coverageStoreForm({}, true));
    return formFrom(client.getCoverageStoreConfig(ws, request.name),
                    [](const CoverageStoreConfig &c) {
                      return coverageStoreForm(c, false);
                    });

  case CrudTarget::Style:
    if (create)
      return Result<WizardSpec>::success(styleCreateForm());
    return formFrom(client.getStyle(ws, request.name), styleEditForm);

  case CrudTarget::Layer: {
    if (create)
      break;
    auto layer = client.getLayerConfig(ws, request.name);
    if (!layer)
      return Result<WizardSpec>::failure(layer.error());
    // the style list only fills the choice; without it the field is omitted
    auto styles = client.listStyles(ws);
    return Result<WizardSpec>::success(layerEditForm(
        layer.value(), styles ? names(styles.value())
                              : std::vector<std::string>{}));
  }

  case CrudTarget::LayerGroup: {
    auto layers = client.listLayers(ws);
    if (!layers)
      return Result<WizardSpec>::failure("cannot list layers: " +
                                         layers.error());
    if (create)
      return Result<WizardSpec>::success(
          layerGroupForm({}, names(layers.value()), true));
    return formFrom(client.getLayerGroup(ws, request.name),
                    [&](const LayerGroupConfig &c) {
                      return layerGroupForm(c, names(layers.value()), false);
                    });
  }

  case CrudTarget::Contact:
    return formFrom(client.getContact(), contactForm);

  case CrudTarget::TileCache: {
    // an unreachable tile layer still gets the common grid sets and formats
    auto tiles = client.getGwcLayer(qualifiedLayer(request));
    return Result<WizardSpec>::success(tileCacheForm(
        qualifiedLayer(request), tiles ? tiles.value() : GwcLayer{}));
  }
  }
  return Result<WizardSpec>::failure(crudTitle(request.op, request.target) +
                                     " is not supported");
}

std::string validateCrudForm(const CrudRequest &request,
                             const FormValues &values) {
  if (request.op == CrudOp::Delete || request.op == CrudOp::Publish ||
      request.target == CrudTarget::Contact)
    return "";
  if (request.target == CrudTarget::TileCache)
    return validateTileCache(values);

  if (request.target != CrudTarget::Style || request.op == CrudOp::Create) {
    if (values.count("name") && trim(valueOf(values, "name")).empty())
      return "Name is required";
  }
  const std::string name = trim(valueOf(values, "name"));
  if (name.find('/') != std::string::npos)
    return "Name must not contain '/'";

  switch (request.target) {
  case CrudTarget::DataStore: {
    if (request.op != CrudOp::Create)
      break;
    const std::string type = valueOf(values, "type");
    if (type == "Directory" && trim(valueOf(values, "dir.url")).empty())
      return "Directory is required";
    if (type == "GeoPackage" && trim(valueOf(values, "gpkg.database")).empty())
      return "GeoPackage file is required";
    if (type == "PostGIS" && (trim(valueOf(values, "pg.host")).empty() ||
                              trim(valueOf(values, "pg.database")).empty()))
      return "Host and database are required";
    if (type == "WFS" && trim(valueOf(values, "wfs.url")).empty())
      return "Capabilities URL is required";
    break;
  }
  case CrudTarget::CoverageStore:
    if (request.op == CrudOp::Create && trim(valueOf(values, "url")).empty())
      return "File URL is required";
    break;
  case CrudTarget::Style:
    if (trim(valueOf(values, "file")).empty())
      return "File path is required";
    break;
  case CrudTarget::LayerGroup:
    if (splitList(valueOf(values, "layers")).empty())
      return "Select at least one layer";
    break;
  default:
    break;
  }
  return "";
}

Status submitCrud(IResourceClient &client, const CrudRequest &request,
                  const FormValues &values) {
  if (request.op == CrudOp::Delete)
    return deleteResource(client, request);
  if (request.op == CrudOp::Publish)
    return client.publishFromStore(request.workspace, request.name,
                                   request.target == CrudTarget::CoverageStore);

  const bool create = request.op == CrudOp::Create;
  switch (request.target) {
  case CrudTarget::Workspace: {
    WorkspaceConfig config = workspaceFromForm(values);
    return create ? client.createWorkspace(config)
                  : client.updateWorkspace(request.name, config);
  }
  case CrudTarget::DataStore: {
    DataStoreConfig config = dataStoreFromForm(request, values);
    return create ? client.createDataStore(config)
                  : client.updateDataStore(request.name, config);
  }
  case CrudTarget::CoverageStore: {
    CoverageStoreConfig config = coverageStoreFromForm(request, values);
    return create ? client.createCoverageStore(config)
                  : client.updateCoverageStore(request.name, config);
  }
  case CrudTarget::Style:
    return replaceStyle(client, request, values, create);
  case CrudTarget::Layer: {
    auto current = client.getLayerConfig(request.workspace, request.name);
    if (!current)
      return current.status();
    LayerConfig config = current.value();
    config.enabled = isTrue(values, "enabled");
    config.advertised = isTrue(values, "advertised");
    config.queryable = isTrue(values, "queryable");
    if (values.count("defaultStyle"))
      config.defaultStyle = valueOf(values, "defaultStyle");
    return client.updateLayer(config);
  }
  case CrudTarget::LayerGroup: {
    LayerGroupConfig config = layerGroupFromForm(request, values);
    return create ? client.createLayerGroup(config)
                  : client.updateLayerGroup(request.name, config);
  }
  case CrudTarget::Contact:
    return client.updateContact(contactFromForm(values));
  case CrudTarget::TileCache: {
    GwcSeedRequest seed = seedFromForm(values);
    return seed.type == "truncate"
               ? client.truncateLayer(qualifiedLayer(request), seed)
               : client.seedLayer(qualifiedLayer(request), seed);
  }
  }
  return Status::failure("unsupported operation");
}

std::string crudConfirmText(const CrudRequest &request) {
  if (request.op == CrudOp::Publish)
    return "Publish a layer from " + crudTargetNoun(request.target) + " '" +
           request.name + "'?";
  return "Are you sure you want to delete " + crudTargetNoun(request.target) +
         " '" + request.name + "'?\nThis action cannot be undone.";
}

std::optional<TreePath> crudResultPath(const CrudRequest &request,
                                       const FormValues &values) {
  if (request.target == CrudTarget::Contact ||
      request.target == CrudTarget::TileCache)
    return std::nullopt;

  TreePath path{request.connectionName};
  if (request.target == CrudTarget::Workspace) {
    if (request.op != CrudOp::Delete)
      path.push_back(trim(valueOf(values, "name")));
    return path;
  }

  path.push_back(request.workspace);
  if (request.op == CrudOp::Publish) {
    path.push_back(categoryTitle(Category::Layers));
    path.push_back(request.name);
    return path;
  }

  path.push_back(*categoryOf(request.target));
  if (request.op == CrudOp::Delete)
    return path;

  std::string name = trim(valueOf(values, "name"));
  path.push_back(name.empty() ? request.name : name);
  return path;
}

#include "verification.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <memory>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils.hpp"

using nlohmann::json;

namespace {

struct PipeCloser {
  void operator()(FILE *f) const { pclose(f); }
};

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

// "MultiPolygon", "gml:MultiSurfacePropertyType", "3D Polygon" -> "polygon"
std::string normaliseGeometry(const std::string &type) {
  std::string t = toLower(type);
  if (t.find("point") != std::string::npos)
    return "point";
  if (t.find("line") != std::string::npos ||
      t.find("curve") != std::string::npos)
    return "line";
  if (t.find("polygon") != std::string::npos ||
      t.find("surface") != std::string::npos)
    return "polygon";
  if (t.empty() || t == "unknown" || t.find("geometry") != std::string::npos)
    return "";
  return t;
}

bool isGeometryColumn(const std::string &name) {
  std::string n = toLower(name);
  return n == "the_geom" || n == "geom" || n == "geometry" || n == "wkb_geometry";
}

} // namespace

std::string VerificationResult::summary() const {
  size_t mismatches = std::count_if(
      checks.begin(), checks.end(),
      [](const std::string &c) { return c.rfind("OK", 0) != 0; });
  if (passed)
    return "verified (" + std::to_string(checks.size()) + " checks)";
  return "verification failed (" + std::to_string(mismatches) + " of " +
         std::to_string(checks.size()) + " checks)";
}

Result<FeatureSummary> parseOgrInfo(const std::string &json_text) {
  try {
    json root = json::parse(json_text);
    const auto &layers = root.at("layers");
    if (!layers.is_array() || layers.empty())
      return Result<FeatureSummary>::failure("ogrinfo reported no layers");

    const json &layer = layers.front();
    FeatureSummary summary;
    summary.layerName = layer.value("name", "");
    summary.featureCount = layer.value("featureCount", int64_t{-1});

    auto geoms = layer.find("geometryFields");
    if (geoms != layer.end() && geoms->is_array() && !geoms->empty()) {
      const json &g = geoms->front();
      summary.geometryType = g.value("type", "");
      auto extent = g.find("extent");
      if (extent != g.end() && extent->is_array() && extent->size() == 4) {
        summary.extent.minx = (*extent)[0].get<double>();
        summary.extent.miny = (*extent)[1].get<double>();
        summary.extent.maxx = (*extent)[2].get<double>();
        summary.extent.maxy = (*extent)[3].get<double>();
        summary.extent.valid = true;
      }
    }

    auto fields = layer.find("fields");
    if (fields != layer.end() && fields->is_array()) {
      for (const auto &field : *fields)
        summary.attributes.push_back(field.value("name", ""));
    }
    return Result<FeatureSummary>::success(summary);
  } catch (const json::exception &e) {
    return Result<FeatureSummary>::failure(
        std::string("failed to parse ogrinfo output: ") + e.what());
  }
}

Result<FeatureSummary> OgrInfoReader::read(const std::string &path) const {
  std::string source = path;
  if (toLower(path).size() > 4 &&
      toLower(path).compare(path.size() - 4, 4, ".zip") == 0)
    source = "/vsizip/" + path;

  std::string command =
      "ogrinfo -json -ro -so -al " + shellQuote(source) + " 2>/dev/null";
  std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"));
  if (!pipe)
    return Result<FeatureSummary>::failure("failed to run ogrinfo");

  std::string output;
  std::array<char, 4096> buffer;
  size_t n;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0)
    output.append(buffer.data(), n);

  if (output.empty())
    return Result<FeatureSummary>::failure("ogrinfo produced no output for " +
                                           path);
  return parseOgrInfo(output);
}

VerificationResult compareSummaries(const FeatureSummary &local,
                                    const FeatureSummary &remote) {
  VerificationResult result;
  result.passed = true;

  if (local.featureCount == remote.featureCount) {
    result.checks.push_back("OK feature count " +
                            std::to_string(local.featureCount));
  } else {
    result.passed = false;
    result.checks.push_back("MISMATCH feature count: local " +
                            std::to_string(local.featureCount) + ", remote " +
                            std::to_string(remote.featureCount));
  }

  std::string lg = normaliseGeometry(local.geometryType);
  std::string rg = normaliseGeometry(remote.geometryType);
  if (lg.empty() || rg.empty()) {
    result.checks.push_back("OK geometry type not compared");
  } else if (lg == rg) {
    result.checks.push_back("OK geometry type " + lg);
  } else {
    result.passed = false;
    result.checks.push_back("MISMATCH geometry type: local " +
                            local.geometryType + ", remote " +
                            remote.geometryType);
  }

  std::set<std::string> remote_attrs;
  for (const auto &attr : remote.attributes)
    remote_attrs.insert(toLower(attr));

  std::vector<std::string> missing;
  size_t compared = 0;
  for (const auto &attr : local.attributes) {
    if (isGeometryColumn(attr))
      continue;
    ++compared;
    if (!remote_attrs.count(toLower(attr)))
      missing.push_back(attr);
  }
  if (missing.empty()) {
    result.checks.push_back("OK " + std::to_string(compared) + " attribute(s)");
  } else {
    result.passed = false;
    std::string names;
    for (const auto &m : missing)
      names += (names.empty() ? "" : ", ") + m;
    result.checks.push_back("MISMATCH missing attribute(s): " + names);
  }
  return result;
}

VerificationResult verifyUpload(IResourceClient &client,
                                const ILocalSummaryReader &reader,
                                const std::string &workspace,
                                const std::string &store_name,
                                const std::string &local_path) {
  VerificationResult failed;
  failed.passed = false;

  auto local = reader.read(local_path);
  if (!local) {
    failed.checks.push_back("ERROR " + local.error());
    spdlog::warn("Verification of {} skipped: {}", local_path, local.error());
    return failed;
  }

  // Published feature types take the name of the source layer
  std::string layer = local.value().layerName.empty()
                          ? store_name
                          : local.value().layerName;
  auto remote = client.describeLayer(workspace, layer);
  if (!remote) {
    failed.checks.push_back("ERROR " + remote.error());
    spdlog::warn("Verification of {} failed: {}", local_path, remote.error());
    return failed;
  }

  auto result = compareSummaries(local.value(), remote.value());
  spdlog::info("Verification of {} -> {}:{}: {}", local_path, workspace, layer,
               result.summary());
  return result;
}

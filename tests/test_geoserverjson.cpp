/**
 * @file test_geoserverjson.cpp
 * @brief Unit tests for decoding and encoding GeoServer REST documents
 *
 * @see geoserverjson.hpp
 */

#include <gtest/gtest.h>
#include "geoserverjson.hpp"

#include <nlohmann/json.hpp>

/**
 * @test NamedListKeepsServerOrder
 * @brief Entries come back in document order, qualified names are stripped
 */
TEST(GeoServerJsonTest, NamedListKeepsServerOrder) {
    const std::string body = R"({"layers": {"layer": [
        {"name": "topp:states", "href": "x"},
        {"name": "roads"},
        {"name": "topp:alpha"}]}})";

    auto result = parseNamedList(body, "layers", "layer");

    ASSERT_TRUE(result.ok()) << result.error();
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].name, "states");
    EXPECT_EQ(result.value()[1].name, "roads");
    EXPECT_EQ(result.value()[2].name, "alpha");
}

/**
 * @test NamedListSingleObject
 * @brief A one-element list may arrive as a bare object
 */
TEST(GeoServerJsonTest, NamedListSingleObject) {
    const std::string body = R"({"dataStores": {"dataStore": {"name": "roads", "enabled": false}}})";

    auto result = parseNamedList(body, "dataStores", "dataStore");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].name, "roads");
    ASSERT_TRUE(result.value()[0].enabled.has_value());
    EXPECT_FALSE(*result.value()[0].enabled);
}

/**
 * @test NamedListEmptyString
 * @brief An empty collection is encoded as "" and means no entries
 */
TEST(GeoServerJsonTest, NamedListEmptyString) {
    auto result = parseNamedList(R"({"workspaces": ""})", "workspaces", "workspace");

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().empty());
}

/**
 * @test NamedListMalformed
 * @brief Undecodable bodies are reported, not thrown
 */
TEST(GeoServerJsonTest, NamedListMalformed) {
    auto result = parseNamedList("<html>oops", "workspaces", "workspace");

    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.error().find("workspaces"), std::string::npos);
}

/**
 * @test DataStoreRoundTripsParameters
 * @brief Connection parameters are read from the entry list
 */
TEST(GeoServerJsonTest, DataStoreParameters) {
    const std::string body = R"({"dataStore": {
        "name": "pg", "type": "PostGIS", "enabled": true,
        "description": "main db",
        "connectionParameters": {"entry": [
            {"@key": "host", "$": "db.local"},
            {"@key": "port", "$": "5432"}]}}})";

    auto result = parseDataStore(body, "topp");

    ASSERT_TRUE(result.ok()) << result.error();
    const DataStoreConfig& ds = result.value();
    EXPECT_EQ(ds.name, "pg");
    EXPECT_EQ(ds.workspace, "topp");
    EXPECT_EQ(ds.kind, DataStoreKind::PostGIS);
    EXPECT_EQ(ds.description, "main db");
    EXPECT_EQ(ds.params.at("host"), "db.local");
    EXPECT_EQ(ds.params.at("port"), "5432");
}

/**
 * @test DataStoreBodyWithoutParams
 * @brief Updates never resend connection parameters
 */
TEST(GeoServerJsonTest, DataStoreBodyWithoutParams) {
    DataStoreConfig config;
    config.name = "roads";
    config.kind = DataStoreKind::PostGIS;
    config.params["host"] = "db";

    auto with = nlohmann::json::parse(dataStoreBody(config, true));
    auto without = nlohmann::json::parse(dataStoreBody(config, false));

    EXPECT_TRUE(with["dataStore"].contains("connectionParameters"));
    EXPECT_FALSE(without["dataStore"].contains("connectionParameters"));
    EXPECT_EQ(without["dataStore"]["name"], "roads");

    // dbtype first, then the non-empty parameters
    const auto& entries = with["dataStore"]["connectionParameters"]["entry"];
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["$"], "postgis");
}

/**
 * @test LayerStoreFromHref
 * @brief The owning store is recovered from the resource link
 */
TEST(GeoServerJsonTest, LayerStoreFromHref) {
    const std::string body = R"({"layer": {
        "name": "topp:states", "enabled": true, "queryable": false,
        "defaultStyle": {"name": "topp:polygon"},
        "styles": {"style": {"name": "line"}},
        "resource": {"href": "http://h/geoserver/rest/workspaces/topp/datastores/shapes/featuretypes/states.json"}}})";

    auto result = parseLayer(body, "topp");

    ASSERT_TRUE(result.ok()) << result.error();
    const LayerConfig& layer = result.value();
    EXPECT_EQ(layer.name, "states");
    EXPECT_EQ(layer.store, "shapes");
    EXPECT_EQ(layer.storeType, "dataStore");
    EXPECT_EQ(layer.defaultStyle, "polygon");
    EXPECT_FALSE(layer.queryable);
    ASSERT_EQ(layer.styles.size(), 1u);
    EXPECT_EQ(layer.styles[0], "line");
}

/**
 * @test LayerGroupBodyQualifiesLayers
 * @brief Members are sent as workspace-qualified names with empty styles
 */
TEST(GeoServerJsonTest, LayerGroupBodyQualifiesLayers) {
    LayerGroupConfig group;
    group.name = "base";
    group.workspace = "topp";
    group.layers = {"roads", "other:rivers"};

    auto body = nlohmann::json::parse(layerGroupBody(group));
    const auto& published = body["layerGroup"]["publishables"]["published"];

    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[0]["name"], "topp:roads");
    EXPECT_EQ(published[1]["name"], "other:rivers");
    EXPECT_EQ(body["layerGroup"]["styles"]["style"].size(), 2u);
    EXPECT_EQ(body["layerGroup"]["workspace"]["name"], "topp");
}

/**
 * @test TileLayerSettings
 * @brief Grid set names are taken from the gridSubsets entries
 */
TEST(GeoServerJsonTest, TileLayerSettings) {
    auto layer = parseGwcLayer(R"({"GeoServerLayer": {"name": "topp:roads", "enabled": false,
        "gridSubsets": [{"gridSetName": "EPSG:4326"}, {"gridSetName": "EPSG:900913"}],
        "mimeFormats": ["image/png", "image/jpeg"]}})");

    ASSERT_TRUE(layer.ok()) << layer.error();
    EXPECT_EQ(layer.value().name, "topp:roads");
    EXPECT_FALSE(layer.value().enabled);
    EXPECT_EQ(layer.value().gridSubsets, (std::vector<std::string>{"EPSG:4326", "EPSG:900913"}));
    EXPECT_EQ(layer.value().mimeFormats, (std::vector<std::string>{"image/png", "image/jpeg"}));

    EXPECT_FALSE(parseGwcLayer(R"({"layer": {}})").ok());
}

/**
 * @test SeedRequestBody
 */
TEST(GeoServerJsonTest, SeedRequestBody) {
    GwcSeedRequest request;
    request.type = "truncate";
    request.gridSetId = "EPSG:3857";
    request.format = "image/png";
    request.zoomStart = 3;
    request.zoomStop = 12;
    request.threadCount = 1;

    auto body = nlohmann::json::parse(gwcSeedBody("topp:roads", request));
    const auto& seed = body["seedRequest"];

    EXPECT_EQ(seed["name"], "topp:roads");
    EXPECT_EQ(seed["type"], "truncate");
    EXPECT_EQ(seed["gridSetId"], "EPSG:3857");
    EXPECT_EQ(seed["zoomStart"], 3);
    EXPECT_EQ(seed["zoomStop"], 12);
    EXPECT_EQ(seed["threadCount"], 1);
}

/**
 * @test Version
 * @brief The GeoServer entry of about/version is picked
 */
TEST(GeoServerJsonTest, Version) {
    const std::string body = R"({"about": {"resource": [
        {"@name": "GeoTools", "Version": "29.1"},
        {"@name": "GeoServer", "Version": "2.23.1"}]}})";

    auto version = parseVersion(body);

    ASSERT_TRUE(version.ok());
    EXPECT_EQ(version.value(), "2.23.1");
}

/**
 * @test SystemStatusMemory
 * @brief Memory usage is computed from the used and total metrics
 */
TEST(GeoServerJsonTest, SystemStatusMemory) {
    const std::string body = R"({"metrics": {"metric": [
        {"name": "MEMORY_USED", "value": "256"},
        {"name": "MEMORY_TOTAL", "value": 1024}]}})";

    ServerStatus status;
    parseSystemStatus(body, status);

    EXPECT_EQ(status.memoryUsed, 256);
    EXPECT_EQ(status.memoryTotal, 1024);
    EXPECT_DOUBLE_EQ(status.memoryUsedPct, 25.0);
}

/**
 * @test DescribeFeatureType
 * @brief gml properties give the geometry type, the rest are attributes
 */
TEST(GeoServerJsonTest, DescribeFeatureType) {
    const std::string body = R"({"featureTypes": [{"typeName": "roads",
        "properties": [
            {"name": "the_geom", "type": "gml:MultiLineString", "localType": "MultiLineString"},
            {"name": "NAME", "type": "xsd:string"},
            {"name": "LANES", "type": "xsd:int"}]}]})";

    auto summary = parseDescribeFeatureType(body);

    ASSERT_TRUE(summary.ok()) << summary.error();
    EXPECT_EQ(summary.value().layerName, "roads");
    EXPECT_EQ(summary.value().geometryType, "MultiLineString");
    EXPECT_EQ(summary.value().attributes, (std::vector<std::string>{"NAME", "LANES"}));
}

/**
 * @test FeatureHits
 * @brief WFS 2.0 and 1.1 hit counts are both understood
 */
TEST(GeoServerJsonTest, FeatureHits) {
    auto wfs20 = parseFeatureHits(R"(<wfs:FeatureCollection numberMatched="42" numberReturned="0">)");
    ASSERT_TRUE(wfs20.ok());
    EXPECT_EQ(wfs20.value(), 42);

    auto wfs11 = parseFeatureHits(R"(<wfs:FeatureCollection numberOfFeatures="7">)");
    ASSERT_TRUE(wfs11.ok());
    EXPECT_EQ(wfs11.value(), 7);

    EXPECT_FALSE(parseFeatureHits("<ows:ExceptionReport/>").ok());
}

/**
 * @test KindLabels
 * @brief Store kinds map to the type names GeoServer uses
 */
TEST(GeoServerJsonTest, KindLabels) {
    EXPECT_EQ(toString(DataStoreKind::Directory), "Directory of spatial files (shapefiles)");
    EXPECT_EQ(toString(CoverageStoreKind::GeoTIFF), "GeoTIFF");
    EXPECT_EQ(toString(StyleFormat::CSS), "css");
}

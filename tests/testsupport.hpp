/**
 * @file testsupport.hpp
 * @brief Test doubles shared by the test suites
 *
 * - FakeResourceClient: scripted in-memory server that records every call
 * - FakeSummaryReader: returns a fixed local feature summary
 * - TestEffectContext: records requested sleeps instead of waiting
 * - EffectDriver: runs effects synchronously in FIFO order, the way the
 *   terminal front end would run them one after another
 */

#ifndef TESTSUPPORT_HPP
#define TESTSUPPORT_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "effect.hpp"
#include "iresourceclient.hpp"
#include "verification.hpp"

/** @brief Listing entries with the given names */
inline std::vector<ResourceItem> items(std::initializer_list<std::string> names) {
    std::vector<ResourceItem> out;
    for (const auto& name : names) {
        ResourceItem item;
        item.name = name;
        out.push_back(item);
    }
    return out;
}

/**
 * @class FakeResourceClient
 * @brief IResourceClient serving canned data
 *
 * Listings are keyed "workspaces" or "<kind>:<workspace>" with kind one of
 * datastores, coveragestores, styles, layers, layergroups. Every call is
 * appended to @ref calls as "<method> <arguments>".
 */
class FakeResourceClient : public IResourceClient {
private:
    Result<std::vector<ResourceItem>> list(const std::string& key) {
        calls.push_back("list " + key);
        if (failingListings.count(key)) {
            return Result<std::vector<ResourceItem>>::failure("HTTP 500 listing " + key);
        }
        auto it = listings.find(key);
        return Result<std::vector<ResourceItem>>::success(
            it == listings.end() ? std::vector<ResourceItem>{} : it->second);
    }

    Status mutation(const std::string& call) {
        calls.push_back(call);
        return mutationStatus;
    }

public:
    std::map<std::string, std::vector<ResourceItem>> listings;
    std::set<std::string> failingListings;
    std::vector<std::string> calls;

    /** @brief Result of every create/update/delete/publish call */
    Status mutationStatus = Status::success();

    /** @brief Local paths whose upload is rejected */
    std::set<std::string> failingUploads;
    std::vector<std::string> uploadedPaths;

    // Returned by the get* calls
    WorkspaceConfig workspace;
    DataStoreConfig dataStore;
    CoverageStoreConfig coverageStore;
    StyleContent style;
    LayerConfig layer;
    LayerGroupConfig layerGroup;
    ContactInfo contact;
    GwcLayer gwcLayer;
    bool failGets = false;

    // Captured by the create/update calls
    std::optional<WorkspaceConfig> submittedWorkspace;
    std::optional<DataStoreConfig> submittedDataStore;
    std::optional<StyleContent> submittedStyle;
    std::optional<LayerConfig> submittedLayer;
    std::optional<LayerGroupConfig> submittedLayerGroup;
    std::optional<ContactInfo> submittedContact;
    std::optional<GwcSeedRequest> submittedSeed;

    ServerStatus serverStatus;
    /** @brief When set, fetchStatus fails with this message */
    std::optional<std::string> offline;

    FeatureSummary publishedSummary;

    template <typename T> Result<T> get(const std::string& call, const T& value) {
        calls.push_back(call);
        if (failGets) {
            return Result<T>::failure("HTTP 404 for " + call);
        }
        return Result<T>::success(value);
    }

    size_t countCalls(const std::string& prefix) const {
        size_t n = 0;
        for (const auto& call : calls) {
            if (call.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    Result<std::vector<ResourceItem>> listWorkspaces() override { return list("workspaces"); }
    Result<std::vector<ResourceItem>> listDataStores(const std::string& ws) override {
        return list("datastores:" + ws);
    }
    Result<std::vector<ResourceItem>> listCoverageStores(const std::string& ws) override {
        return list("coveragestores:" + ws);
    }
    Result<std::vector<ResourceItem>> listStyles(const std::string& ws) override {
        return list("styles:" + ws);
    }
    Result<std::vector<ResourceItem>> listLayers(const std::string& ws) override {
        return list("layers:" + ws);
    }
    Result<std::vector<ResourceItem>> listLayerGroups(const std::string& ws) override {
        return list("layergroups:" + ws);
    }

    Status createWorkspace(const WorkspaceConfig& config) override {
        submittedWorkspace = config;
        return mutation("createWorkspace " + config.name);
    }
    Result<WorkspaceConfig> getWorkspaceConfig(const std::string& name) override {
        return get("getWorkspaceConfig " + name, workspace);
    }
    Status updateWorkspace(const std::string& name, const WorkspaceConfig& config) override {
        submittedWorkspace = config;
        return mutation("updateWorkspace " + name);
    }
    Status deleteWorkspace(const std::string& name) override {
        return mutation("deleteWorkspace " + name);
    }

    Status createDataStore(const DataStoreConfig& config) override {
        submittedDataStore = config;
        return mutation("createDataStore " + config.workspace + " " + config.name);
    }
    Result<DataStoreConfig> getDataStoreConfig(const std::string& ws, const std::string& name) override {
        return get("getDataStoreConfig " + ws + " " + name, dataStore);
    }
    Status updateDataStore(const std::string& name, const DataStoreConfig& config) override {
        submittedDataStore = config;
        return mutation("updateDataStore " + name);
    }
    Status deleteDataStore(const std::string& ws, const std::string& name) override {
        return mutation("deleteDataStore " + ws + " " + name);
    }

    Status createCoverageStore(const CoverageStoreConfig& config) override {
        return mutation("createCoverageStore " + config.workspace + " " + config.name);
    }
    Result<CoverageStoreConfig> getCoverageStoreConfig(const std::string& ws, const std::string& name) override {
        return get("getCoverageStoreConfig " + ws + " " + name, coverageStore);
    }
    Status updateCoverageStore(const std::string& name, const CoverageStoreConfig&) override {
        return mutation("updateCoverageStore " + name);
    }
    Status deleteCoverageStore(const std::string& ws, const std::string& name) override {
        return mutation("deleteCoverageStore " + ws + " " + name);
    }

    Status createStyle(const std::string& ws, const StyleContent& content) override {
        submittedStyle = content;
        return mutation("createStyle " + ws + " " + content.name);
    }
    Result<StyleContent> getStyle(const std::string& ws, const std::string& name) override {
        return get("getStyle " + ws + " " + name, style);
    }
    Status updateStyle(const std::string& ws, const StyleContent& content) override {
        submittedStyle = content;
        return mutation("updateStyle " + ws + " " + content.name);
    }
    Status deleteStyle(const std::string& ws, const std::string& name) override {
        return mutation("deleteStyle " + ws + " " + name);
    }

    Result<LayerConfig> getLayerConfig(const std::string& ws, const std::string& name) override {
        return get("getLayerConfig " + ws + " " + name, layer);
    }
    Status updateLayer(const LayerConfig& config) override {
        submittedLayer = config;
        return mutation("updateLayer " + config.name);
    }
    Status deleteLayer(const std::string& ws, const std::string& name) override {
        return mutation("deleteLayer " + ws + " " + name);
    }
    Status publishFromStore(const std::string& ws, const std::string& store, bool coverage) override {
        return mutation(std::string(coverage ? "publishCoverage " : "publishFeatureType ") +
                        ws + " " + store);
    }

    Status createLayerGroup(const LayerGroupConfig& config) override {
        submittedLayerGroup = config;
        return mutation("createLayerGroup " + config.workspace + " " + config.name);
    }
    Result<LayerGroupConfig> getLayerGroup(const std::string& ws, const std::string& name) override {
        return get("getLayerGroup " + ws + " " + name, layerGroup);
    }
    Status updateLayerGroup(const std::string& name, const LayerGroupConfig& config) override {
        submittedLayerGroup = config;
        return mutation("updateLayerGroup " + name);
    }
    Status deleteLayerGroup(const std::string& ws, const std::string& name) override {
        return mutation("deleteLayerGroup " + ws + " " + name);
    }

    Result<ContactInfo> getContact() override { return get("getContact", contact); }
    Status updateContact(const ContactInfo& info) override {
        submittedContact = info;
        return mutation("updateContact");
    }

    Result<GwcLayer> getGwcLayer(const std::string& layer) override {
        return get("getGwcLayer " + layer, gwcLayer);
    }
    Status seedLayer(const std::string& layer, const GwcSeedRequest& request) override {
        submittedSeed = request;
        return mutation("seedLayer " + layer + " " + request.type);
    }
    Status truncateLayer(const std::string& layer, const GwcSeedRequest& request) override {
        submittedSeed = request;
        return mutation("truncateLayer " + layer);
    }

    Status uploadFile(const std::string& ws, const std::string& store,
                      const std::string& path, FileType) override {
        calls.push_back("uploadFile " + ws + " " + store);
        if (failingUploads.count(path)) {
            return Status::failure("upload of " + store + " rejected");
        }
        uploadedPaths.push_back(path);
        return Status::success();
    }

    Result<std::string> downloadLayer(const std::string& ws, const std::string& name) override {
        return get<std::string>("downloadLayer " + ws + " " + name, "PK-zip");
    }
    Result<std::string> downloadCoverage(const std::string& ws, const std::string& store) override {
        return get<std::string>("downloadCoverage " + ws + " " + store, "II*tiff");
    }
    Result<std::string> downloadStyle(const std::string& ws, const std::string& name) override {
        return get<std::string>("downloadStyle " + ws + " " + name, "<StyledLayerDescriptor/>");
    }

    Result<ServerStatus> fetchStatus() override {
        calls.push_back("fetchStatus");
        if (offline) {
            return Result<ServerStatus>::failure(*offline);
        }
        return Result<ServerStatus>::success(serverStatus);
    }

    Result<FeatureSummary> describeLayer(const std::string& ws, const std::string& name) override {
        return get("describeLayer " + ws + " " + name, publishedSummary);
    }
};

/**
 * @class FakeSummaryReader
 * @brief ILocalSummaryReader returning one canned summary for every file
 */
class FakeSummaryReader : public ILocalSummaryReader {
public:
    FeatureSummary summary;
    bool fail = false;

    Result<FeatureSummary> read(const std::string& path) const override {
        if (fail) {
            return Result<FeatureSummary>::failure("cannot open " + path);
        }
        return Result<FeatureSummary>::success(summary);
    }
};

/**
 * @class TestEffectContext
 * @brief Records requested sleeps and returns immediately
 */
class TestEffectContext : public EffectContext {
public:
    std::vector<std::chrono::milliseconds> sleeps;
    /** @brief Simulates shutdown: every sleep reports an interruption */
    bool interrupted = false;

    bool sleepFor(std::chrono::milliseconds duration) override {
        sleeps.push_back(duration);
        return !interrupted;
    }
};

/**
 * @class EffectDriver
 * @brief Runs effects one after another and feeds results back
 *
 * Timer effects are parked in @ref timers instead of being run, otherwise
 * a periodic refresh would never let the queue drain.
 */
class EffectDriver {
public:
    using Update = std::function<std::vector<Effect>(const Message&)>;

    std::deque<Effect> queue;
    std::vector<Effect> timers;
    std::vector<Message> log;
    std::vector<EffectKind> executed;
    TestEffectContext context;

    void push(std::vector<Effect> effects) {
        for (auto& effect : effects) {
            queue.push_back(std::move(effect));
        }
    }

    /** @brief Runs until the queue is empty (or @p limit effects ran) */
    void run(const Update& update, size_t limit = 10000) {
        while (!queue.empty() && limit-- > 0) {
            Effect effect = std::move(queue.front());
            queue.pop_front();
            if (effect.kind == EffectKind::Timer) {
                timers.push_back(std::move(effect));
                continue;
            }
            executed.push_back(effect.kind);
            Message message = runEffect(effect, context);
            log.push_back(message);
            push(update(message));
        }
    }

    size_t count(EffectKind kind) const {
        size_t n = 0;
        for (EffectKind k : executed) {
            if (k == kind) {
                ++n;
            }
        }
        return n;
    }

    template <typename T> std::vector<T> messages() const {
        std::vector<T> out;
        for (const auto& message : log) {
            if (const T* m = std::get_if<T>(&message)) {
                out.push_back(*m);
            }
        }
        return out;
    }
};

#endif // TESTSUPPORT_HPP

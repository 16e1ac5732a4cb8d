/**
 * @file test_uploadpipeline.cpp
 * @brief Unit tests for the sequential upload pipeline
 *
 * Tests cover:
 * - One upload in flight at a time, progress in file order
 * - Halting on the first failed file
 * - Verification of vector formats only
 * - Batch reports and late messages
 *
 * @see UploadPipeline
 */

#include <gtest/gtest.h>
#include "testsupport.hpp"
#include "uploadpipeline.hpp"

namespace {

UploadFile file(const std::string& path, const std::string& store, FileType type) {
    UploadFile f;
    f.path = path;
    f.storeName = store;
    f.type = type;
    return f;
}

} // namespace

/**
 * @class UploadPipelineTest
 * @brief Fixture wiring a pipeline to a fake server and summary reader
 */
class UploadPipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeResourceClient> client = std::make_shared<FakeResourceClient>();
    std::shared_ptr<FakeSummaryReader> reader = std::make_shared<FakeSummaryReader>();
    UploadPipeline pipeline;
    EffectDriver driver;

    void SetUp() override {
        FeatureSummary summary;
        summary.layerName = "roads";
        summary.featureCount = 12;
        summary.geometryType = "LineString";
        summary.attributes = {"NAME"};
        reader->summary = summary;
        client->publishedSummary = summary;
    }

    static UploadBatch batchOf(std::vector<UploadFile> files) {
        UploadBatch batch;
        batch.connectionId = "c1";
        batch.workspace = "topp";
        batch.files = std::move(files);
        return batch;
    }

    static UploadBatch fourShapefiles() {
        return batchOf({file("/data/a.zip", "a", FileType::Shapefile),
                        file("/data/b.zip", "b", FileType::Shapefile),
                        file("/data/c.zip", "c", FileType::Shapefile),
                        file("/data/d.zip", "d", FileType::Shapefile)});
    }

    std::vector<Effect> update(const Message& message) {
        if (const auto* m = std::get_if<FileUploaded>(&message)) {
            return pipeline.onFileUploaded(*m);
        }
        if (const auto* m = std::get_if<UploadContinue>(&message)) {
            return pipeline.onContinue(*m);
        }
        if (const auto* m = std::get_if<UploadDone>(&message)) {
            pipeline.onDone(*m);
        }
        return {};
    }

    void run(UploadBatch batch) {
        driver.push(pipeline.start(std::move(batch), client, reader));
        driver.run([this](const Message& m) { return update(m); });
    }
};

/**
 * @test StartReportsFirstFile
 * @brief Only the first file's upload is started
 */
TEST_F(UploadPipelineTest, StartReportsFirstFile) {
    auto effects = pipeline.start(fourShapefiles(), client, reader);

    ASSERT_EQ(effects.size(), 2u);
    EXPECT_EQ(effects[0].kind, EffectKind::Immediate);
    EXPECT_EQ(effects[1].kind, EffectKind::Upload);
    EXPECT_EQ(effects[1].label, "upload /data/a.zip");
    EXPECT_TRUE(pipeline.active());
    EXPECT_EQ(pipeline.total(), 4u);
    EXPECT_EQ(pipeline.cursor(), 0u);
    EXPECT_TRUE(client->calls.empty());
}

/**
 * @test UploadsInOrder
 * @brief Every file is uploaded once with progress for each index in order
 */
TEST_F(UploadPipelineTest, UploadsInOrder) {
    run(fourShapefiles());

    EXPECT_EQ(client->uploadedPaths,
              (std::vector<std::string>{"/data/a.zip", "/data/b.zip", "/data/c.zip", "/data/d.zip"}));
    EXPECT_EQ(driver.count(EffectKind::Upload), 4u);

    auto progress = driver.messages<UploadProgress>();
    ASSERT_EQ(progress.size(), 4u);
    for (size_t i = 0; i < progress.size(); ++i) {
        EXPECT_EQ(progress[i].index, i);
        EXPECT_EQ(progress[i].total, 4u);
    }
    EXPECT_EQ(progress[2].fileName, "c.zip");

    EXPECT_TRUE(pipeline.done());
    EXPECT_TRUE(pipeline.succeeded());
    EXPECT_EQ(pipeline.uploadedCount(), 4u);
    EXPECT_EQ(driver.messages<UploadDone>().size(), 1u);
}

/**
 * @test HaltsOnFirstFailure
 * @brief A failure at file k leaves the remaining files untouched
 */
TEST_F(UploadPipelineTest, HaltsOnFirstFailure) {
    client->failingUploads.insert("/data/c.zip");

    run(fourShapefiles());

    EXPECT_EQ(driver.count(EffectKind::Upload), 3u);
    EXPECT_EQ(client->countCalls("uploadFile"), 3u);
    EXPECT_EQ(client->uploadedPaths.size(), 2u);
    EXPECT_TRUE(pipeline.done());
    EXPECT_FALSE(pipeline.succeeded());
    ASSERT_TRUE(pipeline.failedIndex().has_value());
    EXPECT_EQ(*pipeline.failedIndex(), 2u);
    EXPECT_EQ(pipeline.outcomes()[2].error, "upload of c rejected");
    EXPECT_FALSE(pipeline.outcomes()[3].uploaded);

    ASSERT_TRUE(pipeline.lastUploaded().has_value());
    EXPECT_EQ(pipeline.lastUploaded()->storeName, "b");

    auto report = uploadReport(pipeline);
    ASSERT_EQ(report.size(), 4u);
    EXPECT_EQ(report[0], "✓ a.zip  (verified (3 checks))");
    EXPECT_EQ(report[2], "✗ c.zip: upload of c rejected");
    EXPECT_EQ(report[3], "- d.zip: skipped");
}

/**
 * @test FirstFileFailure
 */
TEST_F(UploadPipelineTest, FirstFileFailure) {
    client->failingUploads.insert("/data/a.zip");

    run(fourShapefiles());

    EXPECT_EQ(driver.count(EffectKind::Upload), 1u);
    EXPECT_EQ(pipeline.uploadedCount(), 0u);
    EXPECT_FALSE(pipeline.lastUploaded().has_value());
}

/**
 * @test VerifiesVectorFilesOnly
 * @brief A shapefile archive is verified, a GeoTIFF is not
 */
TEST_F(UploadPipelineTest, VerifiesVectorFilesOnly) {
    run(batchOf({file("/data/roads.zip", "roads", FileType::Shapefile),
                 file("/data/dem.tif", "dem", FileType::GeoTIFF)}));

    ASSERT_TRUE(pipeline.succeeded());
    const auto& outcomes = pipeline.outcomes();
    ASSERT_TRUE(outcomes[0].verification.has_value());
    EXPECT_TRUE(outcomes[0].verification->passed);
    EXPECT_FALSE(outcomes[1].verification.has_value());
    EXPECT_EQ(client->countCalls("describeLayer"), 1u);

    auto report = uploadReport(pipeline);
    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report[1], "✓ dem.tif");
}

/**
 * @test FailedVerificationKeepsUpload
 * @brief A mismatch is reported but the batch goes on
 */
TEST_F(UploadPipelineTest, FailedVerificationKeepsUpload) {
    client->publishedSummary.featureCount = 11;

    run(batchOf({file("/data/roads.zip", "roads", FileType::Shapefile),
                 file("/data/more.gpkg", "more", FileType::GeoPackage)}));

    EXPECT_TRUE(pipeline.succeeded());
    EXPECT_EQ(pipeline.uploadedCount(), 2u);
    ASSERT_TRUE(pipeline.outcomes()[0].verification.has_value());
    EXPECT_FALSE(pipeline.outcomes()[0].verification->passed);
}

/**
 * @test NoReaderNoVerification
 */
TEST_F(UploadPipelineTest, NoReaderNoVerification) {
    driver.push(pipeline.start(batchOf({file("/data/roads.zip", "roads", FileType::Shapefile)}),
                               client, nullptr));
    driver.run([this](const Message& m) { return update(m); });

    EXPECT_TRUE(pipeline.succeeded());
    EXPECT_FALSE(pipeline.outcomes()[0].verification.has_value());
}

/**
 * @test EmptyBatchFinishesImmediately
 */
TEST_F(UploadPipelineTest, EmptyBatchFinishesImmediately) {
    auto effects = pipeline.start(batchOf({}), client, reader);

    ASSERT_EQ(effects.size(), 1u);
    EXPECT_EQ(effects[0].kind, EffectKind::Immediate);
    driver.push(std::move(effects));
    driver.run([this](const Message& m) { return update(m); });
    EXPECT_TRUE(pipeline.succeeded());
    EXPECT_EQ(driver.count(EffectKind::Upload), 0u);
}

/**
 * @test LateMessagesAreIgnored
 * @brief Results of an earlier batch or out-of-order indices change nothing
 */
TEST_F(UploadPipelineTest, LateMessagesAreIgnored) {
    auto first = pipeline.start(fourShapefiles(), client, reader);
    const uint64_t old_batch = pipeline.batchId();
    pipeline.start(fourShapefiles(), client, reader);

    EXPECT_TRUE(pipeline.onFileUploaded(FileUploaded{old_batch, 0, Status::success(), std::nullopt}).empty());
    EXPECT_TRUE(pipeline.onFileUploaded(FileUploaded{pipeline.batchId(), 3, Status::success(), std::nullopt}).empty());
    EXPECT_TRUE(pipeline.onContinue(UploadContinue{pipeline.batchId(), 2}).empty());
    EXPECT_FALSE(pipeline.onDone(UploadDone{old_batch}));
    EXPECT_EQ(pipeline.cursor(), 0u);
}

/**
 * @test CloseOnlyAfterDone
 */
TEST_F(UploadPipelineTest, CloseOnlyAfterDone) {
    pipeline.start(fourShapefiles(), client, reader);
    EXPECT_FALSE(pipeline.onClosed(UploadClosed{pipeline.batchId()}));

    EXPECT_TRUE(pipeline.onDone(UploadDone{pipeline.batchId()}));
    EXPECT_TRUE(pipeline.onClosed(UploadClosed{pipeline.batchId()}));
    EXPECT_FALSE(pipeline.active());
}

/**
 * @test ConfirmText
 */
TEST(UploadConfirmTextTest, ListsFileNames) {
    UploadBatch batch;
    batch.workspace = "topp";
    batch.files = {file("/data/roads.zip", "roads", FileType::Shapefile),
                   file("/data/dem.tif", "dem", FileType::GeoTIFF)};

    EXPECT_EQ(uploadConfirmText(batch),
              "Upload 2 file(s) to workspace 'topp'?\n\n  - roads.zip\n  - dem.tif\n");
}

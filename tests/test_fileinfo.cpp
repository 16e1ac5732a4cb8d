/**
 * @file test_fileinfo.cpp
 * @brief Unit tests for the FileInfo class and file type detection
 *
 * This file contains Google Test unit tests that verify the functionality
 * of the FileInfo class including construction, display name generation,
 * size formatting, color coding, type detection and upload eligibility.
 *
 * @see FileInfo
 * @see detectFileType()
 */

#include <gtest/gtest.h>
#include "fileinfo.hpp"
#include "utils.hpp"

/**
 * @test BasicConstruction
 * @brief Verifies basic FileInfo object construction and getter methods
 *
 * Expected behavior:
 * - Path matches the provided path string
 * - File size matches the provided size
 * - isDirectory() and isParentDir() return false for regular files
 * - A fresh entry is not marked
 */
TEST(FileInfoTest, BasicConstruction) {
    FileInfo info("/tmp/roads.shp", 1024, false);

    EXPECT_EQ(info.getPath(), "/tmp/roads.shp");
    EXPECT_EQ(info.getFileSize(), 1024);
    EXPECT_FALSE(info.isDirectory());
    EXPECT_FALSE(info.isParentDir());
    EXPECT_FALSE(info.isMarked());
}

/**
 * @test DisplayName
 * @brief Verifies display name extraction for files, directories and ".."
 */
TEST(FileInfoTest, DisplayName) {
    FileInfo file("/home/user/rivers.gpkg", 1024, false);
    EXPECT_EQ(file.getDisplayName(), "rivers.gpkg");

    FileInfo dir("/home/user/folder", 0, true);
    EXPECT_EQ(dir.getDisplayName(), "folder/");

    FileInfo parent("/home/user", 0, true, true);
    EXPECT_EQ(parent.getDisplayName(), "..");
}

/**
 * @test Stem
 * @brief The stem is used as the default remote store name
 */
TEST(FileInfoTest, Stem) {
    FileInfo file("/data/uploads/land_use.zip", 10, false);
    EXPECT_EQ(file.getStem(), "land_use");
}

/**
 * @test SizeFormatting
 * @brief Verifies human-readable size formatting
 *
 * Test cases:
 * - 0 byte file: "0 B"
 * - 1 KB file (1024 bytes): "1.0 KB"
 * - 1 MB file (1048576 bytes): "1.0 MB"
 */
TEST(FileInfoTest, SizeFormatting) {
    FileInfo zero("/tmp/empty.sld", 0, false);
    EXPECT_EQ(formatBytes(zero.getFileSize()), "0 B");

    FileInfo kb("/tmp/file.sld", 1024, false);
    EXPECT_EQ(formatBytes(kb.getFileSize()), "1.0 KB");

    FileInfo mb("/tmp/large.tif", 1048576, false);
    EXPECT_EQ(formatBytes(mb.getFileSize()), "1.0 MB");
}

/**
 * @test TypeDetection
 * @brief Extensions are matched case-insensitively
 */
TEST(FileInfoTest, TypeDetection) {
    EXPECT_EQ(detectFileType("a.shp"), FileType::Shapefile);
    EXPECT_EQ(detectFileType("a.ZIP"), FileType::Shapefile);
    EXPECT_EQ(detectFileType("a.gpkg"), FileType::GeoPackage);
    EXPECT_EQ(detectFileType("a.TIF"), FileType::GeoTIFF);
    EXPECT_EQ(detectFileType("a.tiff"), FileType::GeoTIFF);
    EXPECT_EQ(detectFileType("a.geojson"), FileType::GeoJSON);
    EXPECT_EQ(detectFileType("a.sld"), FileType::SLD);
    EXPECT_EQ(detectFileType("a.css"), FileType::CSS);
    EXPECT_EQ(detectFileType("a.txt"), FileType::Other);
    EXPECT_EQ(detectFileType("anything.shp", true), FileType::Directory);
}

/**
 * @test Uploadable
 * @brief Only data and style files can be uploaded, never directories
 */
TEST(FileInfoTest, Uploadable) {
    EXPECT_TRUE(FileInfo("/tmp/a.zip", 1, false).isUploadable());
    EXPECT_TRUE(FileInfo("/tmp/a.tif", 1, false).isUploadable());
    EXPECT_TRUE(FileInfo("/tmp/a.sld", 1, false).isUploadable());
    EXPECT_FALSE(FileInfo("/tmp/a.geojson", 1, false).isUploadable());
    EXPECT_FALSE(FileInfo("/tmp/a.txt", 1, false).isUploadable());
    EXPECT_FALSE(FileInfo("/tmp/dir.shp", 0, true).isUploadable());

    EXPECT_TRUE(isVerifiable(FileType::Shapefile));
    EXPECT_TRUE(isVerifiable(FileType::GeoPackage));
    EXPECT_FALSE(isVerifiable(FileType::GeoTIFF));
}

/**
 * @test ColorCodes
 * @brief Verifies color code assignment
 *
 * - Directories: 4 (Blue)
 * - Styles: 5 (Magenta)
 * - Uploadable data: 2 (Green)
 * - Recognised but not uploadable: 3 (Yellow)
 * - Anything else: 7 (White)
 */
TEST(FileInfoTest, ColorCodes) {
    EXPECT_EQ(FileInfo("/tmp/folder", 0, true).getColorCode(), 4);
    EXPECT_EQ(FileInfo("/tmp/a.css", 1, false).getColorCode(), 5);
    EXPECT_EQ(FileInfo("/tmp/a.gpkg", 1, false).getColorCode(), 2);
    EXPECT_EQ(FileInfo("/tmp/a.json", 1, false).getColorCode(), 3);
    EXPECT_EQ(FileInfo("/tmp/a.txt", 1, false).getColorCode(), 7);
}

/**
 * @test MarkFlag
 * @brief Verifies the mark flag setter and getter
 */
TEST(FileInfoTest, MarkFlag) {
    FileInfo info("/tmp/a.shp", 100, false);

    info.setMarked(true);
    EXPECT_TRUE(info.isMarked());

    info.setMarked(false);
    EXPECT_FALSE(info.isMarked());
}

/**
 * @test TruncateList
 * @brief Long lists in dialogs are cut off with a remainder line
 */
TEST(UtilsTest, TruncateList) {
    std::vector<std::string> names = {"a", "b", "c"};
    EXPECT_EQ(truncateList(names, 5), "  - a\n  - b\n  - c\n");
    EXPECT_EQ(truncateList(names, 2), "  - a\n  - b\n  ... and 1 more\n");
}

/**
 * @test StringHelpers
 * @brief Case-insensitive search, trimming and path joining
 */
TEST(UtilsTest, StringHelpers) {
    EXPECT_TRUE(containsIgnoreCase("Roads_Europe", "europe"));
    EXPECT_FALSE(containsIgnoreCase("roads", "rivers"));
    EXPECT_EQ(trim("  name \n"), "name");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(joinPath({"srv", "ws", "Layers"}), "srv/ws/Layers");
    EXPECT_EQ(joinPath({}), "/");

    std::vector<int> values = {1, 2};
    EXPECT_EQ(safe_at(values, 2), nullptr);
    EXPECT_EQ(safe_at(values, -1), nullptr);
    ASSERT_NE(safe_at(values, 1), nullptr);
    EXPECT_EQ(*safe_at(values, 1), 2);
}

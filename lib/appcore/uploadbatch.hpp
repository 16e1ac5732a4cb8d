#ifndef UPLOADBATCH_HPP
#define UPLOADBATCH_HPP

#include <optional>
#include <string>
#include <vector>

#include "filetype.hpp"
#include "verification.hpp"

struct UploadFile {
  std::string path;
  /** @brief Remote store (or style) name, the file name without extension */
  std::string storeName;
  FileType type = FileType::Other;
};

/**
 * @struct UploadBatch
 * @brief Ordered files going to one workspace of one connection
 */
struct UploadBatch {
  std::string connectionId;
  std::string workspace;
  std::vector<UploadFile> files;
};

/** @brief What happened to one file of a batch */
struct FileOutcome {
  std::string path;
  bool uploaded = false;
  std::string error;
  /** @brief Absent when the format is not verifiable or the upload failed */
  std::optional<VerificationResult> verification;
};

#endif // UPLOADBATCH_HPP

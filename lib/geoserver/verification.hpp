/**
 * @file verification.hpp
 * @brief Post-upload comparison of a local dataset with its published layer
 *
 * After a vector upload the structural summary of the local file (read
 * with GDAL's ogrinfo) is compared with what the server publishes over
 * WFS. A mismatch is a warning on the upload, never a failure of it.
 */

#ifndef VERIFICATION_HPP
#define VERIFICATION_HPP

#include <memory>
#include <string>
#include <vector>

#include "iresourceclient.hpp"
#include "models.hpp"
#include "result.hpp"

/**
 * @struct VerificationResult
 * @brief Outcome of comparing two FeatureSummary values
 */
struct VerificationResult {
  bool passed = false;
  /** @brief One line per check, prefixed with "OK" or "MISMATCH" */
  std::vector<std::string> checks;

  /** @brief Single-line summary for status bars and progress views */
  std::string summary() const;
};

/**
 * @class ILocalSummaryReader
 * @brief Reads the structural summary of a local vector file
 */
class ILocalSummaryReader {
public:
  virtual ~ILocalSummaryReader() = default;
  virtual Result<FeatureSummary> read(const std::string &path) const = 0;
};

/**
 * @class OgrInfoReader
 * @brief ILocalSummaryReader backed by `ogrinfo -json -so -al`
 *
 * ZIP archives are read through GDAL's /vsizip/ virtual file system.
 */
class OgrInfoReader : public ILocalSummaryReader {
public:
  Result<FeatureSummary> read(const std::string &path) const override;
};

/** @brief Parses the JSON printed by `ogrinfo -json -so -al` (first layer) */
Result<FeatureSummary> parseOgrInfo(const std::string &json_text);

/**
 * @brief Compares a local and a remote summary
 *
 * Checks, in order:
 * - feature counts are equal
 * - geometry types are equal after normalisation (skipped if either is unknown)
 * - every local attribute exists remotely (case-insensitive, geometry
 *   columns ignored)
 */
VerificationResult compareSummaries(const FeatureSummary &local,
                                    const FeatureSummary &remote);

/**
 * @brief Runs the whole verification of one uploaded file
 *
 * Reads the local summary, asks @p client for the published layer's summary
 * and compares both. Read or request failures produce a failed result with
 * the error as its only check.
 */
VerificationResult verifyUpload(IResourceClient &client,
                                const ILocalSummaryReader &reader,
                                const std::string &workspace,
                                const std::string &store_name,
                                const std::string &local_path);

#endif // VERIFICATION_HPP

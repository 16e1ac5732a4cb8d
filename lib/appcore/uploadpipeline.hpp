/**
 * @file uploadpipeline.hpp
 * @brief Strictly sequential upload of a batch of local files
 *
 * One file is in flight at a time. After each successful file an
 * UploadContinue message moves the cursor on; the first failure ends the
 * batch and the remaining files are never attempted. Vector files are
 * verified against the published layer right after their upload, inside
 * the same background task. Verification results are kept next to the
 * upload outcome and never turn a successful upload into a failure.
 */

#ifndef UPLOADPIPELINE_HPP
#define UPLOADPIPELINE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "effect.hpp"
#include "iresourceclient.hpp"
#include "uploadbatch.hpp"
#include "verification.hpp"

class UploadPipeline {
private:
  uint64_t m_next_id = 1;
  uint64_t m_batch_id = 0;
  UploadBatch m_batch;
  size_t m_cursor = 0;
  std::vector<FileOutcome> m_outcomes;
  bool m_active = false;
  bool m_done = false;
  std::optional<size_t> m_failed_index;
  std::shared_ptr<IResourceClient> m_client;
  std::shared_ptr<const ILocalSummaryReader> m_reader;

  std::vector<Effect> step();

public:
  /**
   * @brief Starts @p batch
   *
   * @param reader Local summary reader used for verification, may be null
   * @return progress message and the upload effect of the first file
   */
  std::vector<Effect> start(UploadBatch batch,
                            std::shared_ptr<IResourceClient> client,
                            std::shared_ptr<const ILocalSummaryReader> reader);

  std::vector<Effect> onFileUploaded(const FileUploaded &message);
  std::vector<Effect> onContinue(const UploadContinue &message);
  /** @return false for a message of another batch */
  bool onDone(const UploadDone &message);
  /** @brief Forgets a finished batch after its progress view closed */
  bool onClosed(const UploadClosed &message);

  bool active() const { return m_active; }
  bool done() const { return m_done; }
  bool succeeded() const { return m_done && !m_failed_index; }
  uint64_t batchId() const { return m_batch_id; }
  size_t cursor() const { return m_cursor; }
  size_t total() const { return m_batch.files.size(); }
  std::optional<size_t> failedIndex() const { return m_failed_index; }
  const UploadBatch &batch() const { return m_batch; }
  const std::vector<FileOutcome> &outcomes() const { return m_outcomes; }
  size_t uploadedCount() const;

  /** @brief Store of the last file that made it to the server, if any */
  std::optional<UploadFile> lastUploaded() const;
};

/** @brief "Upload 3 file(s) to workspace 'x'?" followed by the file list */
std::string uploadConfirmText(const UploadBatch &batch);

/** @brief Multi-line report of a finished batch */
std::vector<std::string> uploadReport(const UploadPipeline &pipeline);

#endif // UPLOADPIPELINE_HPP

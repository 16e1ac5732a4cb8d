#include "uploadpipeline.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace fs = std::filesystem;

std::vector<Effect>
UploadPipeline::start(UploadBatch batch,
                      std::shared_ptr<IResourceClient> client,
                      std::shared_ptr<const ILocalSummaryReader> reader) {
  m_batch_id = m_next_id++;
  m_batch = std::move(batch);
  m_client = std::move(client);
  m_reader = std::move(reader);
  m_cursor = 0;
  m_outcomes.clear();
  m_outcomes.resize(m_batch.files.size());
  for (size_t i = 0; i < m_batch.files.size(); ++i)
    m_outcomes[i].path = m_batch.files[i].path;
  m_failed_index.reset();
  m_done = false;
  m_active = true;

  spdlog::info("upload batch {}: {} file(s) to {}", m_batch_id, total(),
               m_batch.workspace);
  if (m_batch.files.empty())
    return {immediate(UploadDone{m_batch_id})};
  return step();
}

std::vector<Effect> UploadPipeline::step() {
  const UploadFile file = m_batch.files[m_cursor];
  const uint64_t batch_id = m_batch_id;
  const size_t index = m_cursor;
  const std::string workspace = m_batch.workspace;
  auto client = m_client;
  auto reader = m_reader;

  std::vector<Effect> effects;
  effects.push_back(immediate(UploadProgress{
      batch_id, index, total(), fs::path(file.path).filename().string(),
      false}));
  effects.push_back(makeEffect(
      EffectKind::Upload, "upload " + file.path,
      [client, reader, file, workspace, batch_id,
       index](EffectContext &) -> Message {
        FileUploaded result{batch_id, index, Status::success(), std::nullopt};
        result.status =
            client->uploadFile(workspace, file.storeName, file.path, file.type);
        if (result.status && reader && isVerifiable(file.type))
          result.verification = verifyUpload(*client, *reader, workspace,
                                             file.storeName, file.path);
        return result;
      },
      [batch_id, index](const std::string &error) -> Message {
        return FileUploaded{batch_id, index, Status::failure(error),
                            std::nullopt};
      }));
  return effects;
}

std::vector<Effect>
UploadPipeline::onFileUploaded(const FileUploaded &message) {
  if (!m_active || message.batchId != m_batch_id || message.index != m_cursor)
    return {};

  FileOutcome &outcome = m_outcomes[message.index];
  if (!message.status) {
    outcome.error = message.status.error();
    m_failed_index = message.index;
    spdlog::warn("upload of {} failed: {}", outcome.path, outcome.error);
    return {immediate(UploadDone{m_batch_id})};
  }

  outcome.uploaded = true;
  outcome.verification = message.verification;
  if (outcome.verification && !outcome.verification->passed)
    spdlog::warn("verification of {}: {}", outcome.path,
                 outcome.verification->summary());

  if (message.index + 1 < total())
    return {immediate(UploadContinue{m_batch_id, message.index + 1})};
  return {immediate(UploadDone{m_batch_id})};
}

std::vector<Effect> UploadPipeline::onContinue(const UploadContinue &message) {
  if (!m_active || m_done || message.batchId != m_batch_id ||
      message.nextIndex != m_cursor + 1 || message.nextIndex >= total())
    return {};
  m_cursor = message.nextIndex;
  return step();
}

bool UploadPipeline::onDone(const UploadDone &message) {
  if (!m_active || message.batchId != m_batch_id)
    return false;
  m_done = true;
  spdlog::info("upload batch {} finished: {}/{} uploaded", m_batch_id,
               uploadedCount(), total());
  return true;
}

bool UploadPipeline::onClosed(const UploadClosed &message) {
  if (!m_active || !m_done || message.batchId != m_batch_id)
    return false;
  m_active = false;
  m_client.reset();
  m_reader.reset();
  return true;
}

size_t UploadPipeline::uploadedCount() const {
  size_t count = 0;
  for (const auto &outcome : m_outcomes) {
    if (outcome.uploaded)
      ++count;
  }
  return count;
}

std::optional<UploadFile> UploadPipeline::lastUploaded() const {
  for (size_t i = m_outcomes.size(); i-- > 0;) {
    if (m_outcomes[i].uploaded)
      return m_batch.files[i];
  }
  return std::nullopt;
}

std::string uploadConfirmText(const UploadBatch &batch) {
  std::vector<std::string> names;
  for (const auto &file : batch.files)
    names.push_back(fs::path(file.path).filename().string());
  return "Upload " + std::to_string(batch.files.size()) +
         " file(s) to workspace '" + batch.workspace + "'?\n\n" +
         truncateList(names, 5);
}

std::vector<std::string> uploadReport(const UploadPipeline &pipeline) {
  std::vector<std::string> lines;
  const auto &outcomes = pipeline.outcomes();
  for (size_t i = 0; i < outcomes.size(); ++i) {
    const auto &outcome = outcomes[i];
    const std::string name = fs::path(outcome.path).filename().string();
    if (outcome.uploaded) {
      std::string line = "✓ " + name;
      if (outcome.verification)
        line += "  (" + outcome.verification->summary() + ")";
      lines.push_back(line);
    } else if (!outcome.error.empty()) {
      lines.push_back("✗ " + name + ": " + outcome.error);
    } else if (pipeline.done()) {
      lines.push_back("- " + name + ": skipped");
    }
  }
  return lines;
}

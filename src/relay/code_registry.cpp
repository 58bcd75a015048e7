#include "relay/code_registry.hpp"

#include "crypto/aead.hpp"
#include "utilities/logger.h"
#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <algorithm>
#include <cctype>
#include <cppcodec/hex_lower.hpp>
#include <sodium.h>
#include <utility>

namespace quickshare::relay {

namespace {

const char *const kComponent = "code_registry";

bool isHexDigest(const std::string &s) {
  return s.size() == 64 && std::all_of(s.begin(), s.end(), [](char c) {
           return std::isxdigit(static_cast<unsigned char>(c)) != 0;
         });
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return s;
}

void throwForTerminal(const CodeRecord &code) {
  switch (code.status) {
  case CodeStatus::Completed:
    throw RelayError(ErrorCode::CodeCompleted,
                     "Code " + code.lookupCode + " has reached its usage limit");
  case CodeStatus::Expired:
    throw RelayError(ErrorCode::CodeExpired,
                     "Code " + code.lookupCode + " has expired");
  case CodeStatus::Invalidated:
    throw RelayError(ErrorCode::CodeInvalidated,
                     "Code " + code.lookupCode + " was invalidated by the sender");
  default:
    break;
  }
}

} // namespace

const char *codeStatusName(CodeStatus status) {
  switch (status) {
  case CodeStatus::Waiting:
    return "waiting";
  case CodeStatus::Transferring:
    return "transferring";
  case CodeStatus::Completed:
    return "completed";
  case CodeStatus::Expired:
    return "expired";
  case CodeStatus::Invalidated:
    return "invalidated";
  }
  return "unknown";
}

CodeStatus codeStatusFromName(const std::string &name) {
  if (name == "transferring")
    return CodeStatus::Transferring;
  if (name == "completed")
    return CodeStatus::Completed;
  if (name == "expired")
    return CodeStatus::Expired;
  if (name == "invalidated")
    return CodeStatus::Invalidated;
  return CodeStatus::Waiting;
}

PickupCodeRegistry::PickupCodeRegistry(Options options, NowFn now)
    : options_(std::move(options)), now_(std::move(now)) {}

std::string PickupCodeRegistry::fingerprint(const std::string &ownerId,
                                            const std::string &contentHash) const {
  crypto::ensureSodium();
  const std::string message = ownerId + ":" + toLower(contentHash);
  crypto_auth_hmacsha256_state state;
  crypto_auth_hmacsha256_init(
      &state, reinterpret_cast<const unsigned char *>(options_.pepper.data()),
      options_.pepper.size());
  crypto_auth_hmacsha256_update(
      &state, reinterpret_cast<const unsigned char *>(message.data()),
      message.size());
  unsigned char mac[crypto_auth_hmacsha256_BYTES];
  crypto_auth_hmacsha256_final(&state, mac);
  return cppcodec::hex_lower::encode(mac, sizeof(mac));
}

std::string PickupCodeRegistry::newFileId() {
  unsigned char raw[16];
  crypto::randomBytes(raw, sizeof(raw));
  return cppcodec::hex_lower::encode(raw, sizeof(raw));
}

std::string PickupCodeRegistry::allocateLookupCode() const {
  for (int attempt = 0; attempt < options_.codeGenerationAttempts; ++attempt) {
    std::string candidate = PickupCode::randomSegment();
    if (codeOwners_.find(candidate) == codeOwners_.end()) {
      return candidate;
    }
  }
  throw RelayError(ErrorCode::Internal,
                   "Could not allocate a unique pickup code after " +
                       std::to_string(options_.codeGenerationAttempts) +
                       " attempts");
}

std::shared_ptr<PickupCodeRegistry::Partition>
PickupCodeRegistry::partitionForCode(const std::string &lookupCode) const {
  std::shared_lock<std::shared_mutex> lock(indexMutex_);
  auto owner = codeOwners_.find(lookupCode);
  if (owner == codeOwners_.end()) {
    return nullptr;
  }
  auto it = partitions_.find(owner->second);
  return it == partitions_.end() ? nullptr : it->second;
}

std::shared_ptr<PickupCodeRegistry::Partition>
PickupCodeRegistry::partitionForOwner(const std::string &ownerId) const {
  std::shared_lock<std::shared_mutex> lock(indexMutex_);
  auto it = partitions_.find(ownerId);
  return it == partitions_.end() ? nullptr : it->second;
}

void PickupCodeRegistry::applyExpiry(CodeRecord &code) const {
  if (!isTerminal(code.status) && now_() >= code.expiresAt) {
    code.status = CodeStatus::Expired;
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Code " + code.lookupCode + " expired");
  }
}

CodeRecord &PickupCodeRegistry::liveCode(Partition &partition,
                                         const std::string &lookupCode) {
  auto it = partition.codes.find(lookupCode);
  if (it == partition.codes.end()) {
    throw RelayError(ErrorCode::CodeNotFound,
                     "Unknown pickup code " + lookupCode);
  }
  applyExpiry(it->second);
  throwForTerminal(it->second);
  return it->second;
}

CodeRecord PickupCodeRegistry::snapshot(const Partition &partition,
                                        const CodeRecord &code) const {
  CodeRecord copy = code;
  auto file = partition.files.find(code.fileId);
  if (file != partition.files.end()) {
    copy.fileName = file->second.fileName;
    copy.fileSize = file->second.fileSize;
    copy.mimeType = file->second.mimeType;
    copy.totalChunks = file->second.totalChunks;
  }
  return copy;
}

bool PickupCodeRegistry::fileHasLiveCode(const Partition &partition,
                                         const FileRecord &file) const {
  const TimePoint now = now_();
  return std::any_of(file.codes.begin(), file.codes.end(),
                     [&](const std::string &lookup) {
                       auto it = partition.codes.find(lookup);
                       return it != partition.codes.end() &&
                              !isTerminal(it->second.status) &&
                              now < it->second.expiresAt;
                     });
}

std::optional<DuplicateConflict>
PickupCodeRegistry::findDuplicate(const Partition &partition,
                                  const std::string &fp, TimePoint now) const {
  auto entry = partition.fingerprints.find(fp);
  if (entry == partition.fingerprints.end()) {
    return std::nullopt;
  }
  const FileRecord *match = nullptr;
  for (const auto &fileId : entry->second) {
    auto it = partition.files.find(fileId);
    if (it == partition.files.end()) {
      continue;
    }
    const FileRecord &file = it->second;
    if (file.invalidated || file.storageReleased ||
        now >= file.storageExpiresAt || !fileHasLiveCode(partition, file)) {
      continue;
    }
    // Prefer a finished upload: it is the one that can be reused.
    if (!match || (file.uploadComplete && !match->uploadComplete)) {
      match = &file;
    }
  }
  if (!match) {
    return std::nullopt;
  }
  DuplicateConflict conflict;
  conflict.fileId = match->fileId;
  conflict.uploadComplete = match->uploadComplete;
  for (const auto &lookup : match->codes) {
    auto it = partition.codes.find(lookup);
    if (it != partition.codes.end() && !isTerminal(it->second.status) &&
        now < it->second.expiresAt) {
      conflict.lookupCode = it->second.lookupCode;
      conflict.expiresAt = toUnixSeconds(it->second.expiresAt);
    }
  }
  return conflict;
}

void PickupCodeRegistry::forgetFingerprint(Partition &partition,
                                           const FileRecord &file) {
  if (file.fingerprint.empty()) {
    return;
  }
  auto entry = partition.fingerprints.find(file.fingerprint);
  if (entry == partition.fingerprints.end()) {
    return;
  }
  entry->second.erase(file.fileId);
  if (entry->second.empty()) {
    partition.fingerprints.erase(entry);
  }
}

CreateCodeResult PickupCodeRegistry::createCode(const CreateCodeRequest &request) {
  if (request.ownerId.empty()) {
    throw RelayError(ErrorCode::InvalidRequest, "Missing owner");
  }
  const unsigned int usageLimit =
      request.usageLimit.value_or(options_.defaultUsageLimit);
  if (usageLimit < 1 || usageLimit > options_.maxUsageLimit) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Usage limit must be between 1 and " +
                         std::to_string(options_.maxUsageLimit));
  }
  const auto ttl = request.ttlHours
                       ? std::chrono::hours(*request.ttlHours)
                       : options_.defaultTtl;
  if (ttl.count() < 1 || ttl > options_.maxTtl) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Expiry must be between 1 and " +
                         std::to_string(options_.maxTtl.count()) + " hours");
  }
  std::string fp;
  if (request.contentHash) {
    if (!isHexDigest(*request.contentHash)) {
      throw RelayError(ErrorCode::InvalidRequest,
                       "Content hash must be a hex SHA-256 digest");
    }
    fp = fingerprint(request.ownerId, *request.contentHash);
  }

  const TimePoint now = now_();
  TimePoint expiresAt = now + ttl;

  std::unique_lock<std::shared_mutex> indexLock(indexMutex_);
  auto &slot = partitions_[request.ownerId];
  if (!slot) {
    slot = std::make_shared<Partition>();
  }
  std::shared_ptr<Partition> partition = slot;
  std::lock_guard<std::mutex> lock(partition->mutex);

  CreateCodeResult result;
  CodeRecord code;
  code.ownerId = request.ownerId;
  code.usageLimit = usageLimit;
  code.createdAt = now;

  if (request.reuseFileId) {
    auto owner = fileOwners_.find(*request.reuseFileId);
    if (owner == fileOwners_.end()) {
      throw RelayError(ErrorCode::CodeNotFound,
                       "Unknown file " + *request.reuseFileId);
    }
    if (owner->second != request.ownerId) {
      throw RelayError(ErrorCode::Forbidden,
                       "File " + *request.reuseFileId + " belongs to another user");
    }
    auto stored = partition->files.find(*request.reuseFileId);
    if (stored == partition->files.end()) {
      throw RelayError(ErrorCode::CodeNotFound,
                       "Unknown file " + *request.reuseFileId);
    }
    FileRecord &file = stored->second;
    if (file.invalidated || file.storageReleased) {
      throw RelayError(ErrorCode::CodeInvalidated,
                       "File " + file.fileId + " is no longer stored");
    }
    if (!file.uploadComplete) {
      throw RelayError(ErrorCode::InvalidRequest,
                       "File " + file.fileId + " has not finished uploading");
    }
    if (now >= file.storageExpiresAt) {
      throw RelayError(ErrorCode::CodeExpired,
                       "Stored chunks of file " + file.fileId + " have expired");
    }
    expiresAt = std::min(expiresAt, file.storageExpiresAt);
    code.lookupCode = allocateLookupCode();
    code.fileId = file.fileId;
    code.storageCode = file.storageCode;
    code.status = CodeStatus::Transferring;
    code.reused = true;
    file.codes.push_back(code.lookupCode);
  } else {
    if (!fp.empty()) {
      if (auto conflict = findDuplicate(*partition, fp, now)) {
        Logger::getInstance().log(LogLevel::INFO, kComponent,
                                  "Duplicate upload by " + request.ownerId +
                                      " matches file " + conflict->fileId +
                                      (conflict->uploadComplete ? "" : " (still uploading)"));
        result.conflict = std::move(*conflict);
        return result;
      }
    }
    FileRecord file;
    file.fileId = newFileId();
    file.ownerId = request.ownerId;
    file.fileName = request.fileName;
    file.fileSize = request.fileSize;
    file.mimeType = request.mimeType;
    file.fingerprint = fp;
    file.createdAt = now;
    file.storageExpiresAt = expiresAt;
    code.lookupCode = allocateLookupCode();
    code.fileId = file.fileId;
    code.storageCode = code.lookupCode;
    file.storageCode = code.lookupCode;
    file.codes.push_back(code.lookupCode);
    if (!fp.empty()) {
      partition->fingerprints[fp].insert(file.fileId);
    }
    fileOwners_[file.fileId] = request.ownerId;
    partition->files.emplace(file.fileId, std::move(file));
  }

  code.expiresAt = expiresAt;
  codeOwners_[code.lookupCode] = request.ownerId;

  result.lookupCode = code.lookupCode;
  result.fileId = code.fileId;
  result.expiresAt = toUnixSeconds(expiresAt);
  result.usageLimit = usageLimit;
  result.reused = code.reused;

  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Issued code " + code.lookupCode + " for file " +
                                code.fileId + (code.reused ? " (reused)" : "") +
                                " owner=" + request.ownerId);
  partition->codes.emplace(code.lookupCode, std::move(code));
  return result;
}

CodeRecord PickupCodeRegistry::checkAccess(const std::string &lookupCode) {
  auto partition = partitionForCode(lookupCode);
  if (!partition) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  std::lock_guard<std::mutex> lock(partition->mutex);
  return snapshot(*partition, liveCode(*partition, lookupCode));
}

CodeRecord PickupCodeRegistry::requireOwner(const std::string &lookupCode,
                                            const std::string &ownerId) {
  CodeRecord code = checkAccess(lookupCode);
  if (code.ownerId != ownerId) {
    throw RelayError(ErrorCode::Forbidden,
                     "Code " + lookupCode + " belongs to another user");
  }
  return code;
}

CodeStatusView PickupCodeRegistry::status(const std::string &lookupCode) {
  auto partition = partitionForCode(lookupCode);
  if (!partition) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  std::lock_guard<std::mutex> lock(partition->mutex);
  auto it = partition->codes.find(lookupCode);
  if (it == partition->codes.end()) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  applyExpiry(it->second);
  const CodeRecord code = snapshot(*partition, it->second);
  CodeStatusView view;
  view.lookupCode = code.lookupCode;
  view.fileId = code.fileId;
  view.status = code.status;
  view.usedCount = code.usedCount;
  view.usageLimit = code.usageLimit;
  view.createdAt = toUnixSeconds(code.createdAt);
  view.expiresAt = toUnixSeconds(code.expiresAt);
  view.fileName = code.fileName;
  view.fileSize = code.fileSize;
  view.totalChunks = code.totalChunks;
  return view;
}

void PickupCodeRegistry::markUploadComplete(const std::string &lookupCode,
                                            const std::string &ownerId,
                                            const UploadManifest &manifest) {
  auto partition = partitionForCode(lookupCode);
  if (!partition) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  std::lock_guard<std::mutex> lock(partition->mutex);
  CodeRecord &code = liveCode(*partition, lookupCode);
  if (code.ownerId != ownerId) {
    throw RelayError(ErrorCode::Forbidden,
                     "Code " + lookupCode + " belongs to another user");
  }
  FileRecord &file = partition->files.at(code.fileId);
  if (code.reused || file.uploadComplete) {
    // Chunks were already confirmed for this file.
    code.status = CodeStatus::Transferring;
    return;
  }
  if (manifest.fileSize != file.fileSize) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Manifest size " + std::to_string(manifest.fileSize) +
                         " does not match declared size " +
                         std::to_string(file.fileSize));
  }
  file.totalChunks = manifest.totalChunks;
  file.chunkSize = manifest.chunkSize;
  file.uploadComplete = true;
  code.status = CodeStatus::Transferring;
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Upload of " + lookupCode + " complete (" +
                                std::to_string(manifest.totalChunks) +
                                " chunks)");
}

std::string PickupCodeRegistry::openSession(const std::string &lookupCode) {
  auto partition = partitionForCode(lookupCode);
  if (!partition) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  unsigned char raw[16];
  crypto::randomBytes(raw, sizeof(raw));
  std::string sessionId = cppcodec::hex_lower::encode(raw, sizeof(raw));
  std::lock_guard<std::mutex> lock(partition->mutex);
  auto &sessions = liveCode(*partition, lookupCode).sessions;
  while (!sessions.empty() && sessions.size() >= options_.maxSessionsPerCode) {
    sessions.pop_front();
  }
  sessions.push_back(sessionId);
  return sessionId;
}

void PickupCodeRegistry::validateSession(const std::string &lookupCode,
                                         const std::string &sessionId) {
  if (sessionId.empty()) {
    return;
  }
  auto partition = partitionForCode(lookupCode);
  if (!partition) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  std::lock_guard<std::mutex> lock(partition->mutex);
  const CodeRecord &code = liveCode(*partition, lookupCode);
  if (std::find(code.sessions.begin(), code.sessions.end(), sessionId) ==
      code.sessions.end()) {
    throw RelayError(ErrorCode::InvalidRequest,
                     "Unknown download session for " + lookupCode);
  }
}

DownloadCompletion
PickupCodeRegistry::recordDownloadComplete(const std::string &lookupCode,
                                           const std::string &sessionId) {
  auto partition = partitionForCode(lookupCode);
  if (!partition) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown pickup code " + lookupCode);
  }
  std::lock_guard<std::mutex> lock(partition->mutex);
  CodeRecord &code = liveCode(*partition, lookupCode);
  if (code.status == CodeStatus::Waiting) {
    throw RelayError(ErrorCode::KeyNotReady,
                     "Sender has not finished uploading " + lookupCode);
  }
  if (!sessionId.empty()) {
    auto session = std::find(code.sessions.begin(), code.sessions.end(), sessionId);
    if (session == code.sessions.end()) {
      throw RelayError(ErrorCode::InvalidRequest,
                       "Unknown download session for " + lookupCode);
    }
    code.sessions.erase(session);
  }
  ++code.usedCount;
  if (code.usedCount >= code.usageLimit) {
    code.status = CodeStatus::Completed;
    code.sessions.clear();
  }
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Download of " + lookupCode + " complete (" +
                                std::to_string(code.usedCount) + "/" +
                                std::to_string(code.usageLimit) + ")");
  DownloadCompletion completion;
  completion.usedCount = code.usedCount;
  completion.usageLimit = code.usageLimit;
  completion.status = code.status;
  return completion;
}

std::vector<std::string>
PickupCodeRegistry::invalidateFile(const std::string &fileId,
                                   const std::string &ownerId) {
  std::shared_ptr<Partition> partition;
  {
    std::shared_lock<std::shared_mutex> lock(indexMutex_);
    auto owner = fileOwners_.find(fileId);
    if (owner == fileOwners_.end()) {
      throw RelayError(ErrorCode::CodeNotFound, "Unknown file " + fileId);
    }
    if (owner->second != ownerId) {
      throw RelayError(ErrorCode::Forbidden,
                       "File " + fileId + " belongs to another user");
    }
    partition = partitions_.at(ownerId);
  }
  std::lock_guard<std::mutex> lock(partition->mutex);
  auto it = partition->files.find(fileId);
  if (it == partition->files.end()) {
    throw RelayError(ErrorCode::CodeNotFound, "Unknown file " + fileId);
  }
  FileRecord &file = it->second;
  file.invalidated = true;
  forgetFingerprint(*partition, file);
  for (const auto &lookup : file.codes) {
    CodeRecord &code = partition->codes.at(lookup);
    if (!isTerminal(code.status)) {
      code.status = CodeStatus::Invalidated;
      code.sessions.clear();
    }
  }
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "File " + fileId + " invalidated by " + ownerId);
  return file.codes;
}

SweepReport PickupCodeRegistry::sweepOwner(const std::string &ownerId) {
  SweepReport report;
  auto partition = partitionForOwner(ownerId);
  if (!partition) {
    return report;
  }
  std::vector<std::string> droppedCodes;
  std::vector<std::string> droppedFiles;
  bool partitionEmpty = false;
  {
    std::lock_guard<std::mutex> lock(partition->mutex);
    const TimePoint now = now_();
    for (auto &kv : partition->codes) {
      CodeRecord &code = kv.second;
      if (!isTerminal(code.status) && now >= code.expiresAt) {
        code.status = CodeStatus::Expired;
        ++report.expiredCodes;
      }
      if (isTerminal(code.status) && !code.keyReleased) {
        report.revokedKeyCodes.insert(code.lookupCode);
        code.keyReleased = true;
      }
    }
    for (auto &kv : partition->files) {
      FileRecord &file = kv.second;
      if (file.storageReleased) {
        continue;
      }
      if (file.invalidated || now >= file.storageExpiresAt ||
          !fileHasLiveCode(*partition, file)) {
        report.releasedStorageCodes.insert(file.storageCode);
        file.storageReleased = true;
        forgetFingerprint(*partition, file);
      }
    }
    for (auto it = partition->codes.begin(); it != partition->codes.end();) {
      const CodeRecord &code = it->second;
      if (isTerminal(code.status) &&
          now >= code.expiresAt + options_.tombstoneRetention) {
        auto file = partition->files.find(code.fileId);
        if (file != partition->files.end()) {
          auto &codes = file->second.codes;
          codes.erase(std::remove(codes.begin(), codes.end(), code.lookupCode),
                      codes.end());
        }
        droppedCodes.push_back(it->first);
        it = partition->codes.erase(it);
      } else {
        ++it;
      }
    }
    for (auto it = partition->files.begin(); it != partition->files.end();) {
      if (it->second.storageReleased && it->second.codes.empty()) {
        droppedFiles.push_back(it->first);
        it = partition->files.erase(it);
      } else {
        ++it;
      }
    }
    partitionEmpty = partition->codes.empty() && partition->files.empty();
  }
  report.droppedRecords = droppedCodes.size() + droppedFiles.size();

  if (!droppedCodes.empty() || !droppedFiles.empty() || partitionEmpty) {
    std::unique_lock<std::shared_mutex> indexLock(indexMutex_);
    for (const auto &lookup : droppedCodes) {
      codeOwners_.erase(lookup);
    }
    for (const auto &fileId : droppedFiles) {
      fileOwners_.erase(fileId);
    }
    auto it = partitions_.find(ownerId);
    if (it != partitions_.end()) {
      std::shared_ptr<Partition> current = it->second;
      std::unique_lock<std::mutex> lock(current->mutex);
      if (current->codes.empty() && current->files.empty()) {
        lock.unlock();
        partitions_.erase(it);
      }
    }
  }
  return report;
}

std::vector<std::string> PickupCodeRegistry::owners() const {
  std::shared_lock<std::shared_mutex> lock(indexMutex_);
  std::vector<std::string> result;
  result.reserve(partitions_.size());
  for (const auto &kv : partitions_) {
    result.push_back(kv.first);
  }
  return result;
}

} // namespace quickshare::relay

#include "relay/wire_format.hpp"

#include "utilities/relay_error.hpp"

#include <cppcodec/base64_rfc4648.hpp>

namespace quickshare::relay {

using base64 = cppcodec::base64_rfc4648;
using json = nlohmann::json;

std::string encodeBase64(const std::vector<std::byte> &data) {
  return base64::encode(reinterpret_cast<const unsigned char *>(data.data()),
                        data.size());
}

std::vector<std::byte> decodeBase64(const std::string &text) {
  std::vector<unsigned char> raw;
  try {
    raw = base64::decode(text.data(), text.size());
  } catch (const cppcodec::parse_error &e) {
    throw RelayError(ErrorCode::InvalidRequest,
                     std::string("Malformed base64 payload: ") + e.what());
  }
  std::vector<std::byte> out(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    out[i] = static_cast<std::byte>(raw[i]);
  }
  return out;
}

void to_json(json &j, const CreateCodeRequest &r) {
  j = json{{"name", r.fileName}, {"size", r.fileSize}, {"mimeType", r.mimeType}};
  if (r.contentHash)
    j["contentHash"] = *r.contentHash;
  if (r.usageLimit)
    j["usageLimit"] = *r.usageLimit;
  if (r.ttlHours)
    j["ttlHours"] = *r.ttlHours;
  if (r.reuseFileId)
    j["reuseFileId"] = *r.reuseFileId;
}

void from_json(const json &j, CreateCodeRequest &r) {
  r.fileName = j.value("name", std::string());
  r.fileSize = j.value("size", std::uint64_t{0});
  r.mimeType = j.value("mimeType", std::string("application/octet-stream"));
  if (j.contains("contentHash") && !j.at("contentHash").is_null())
    r.contentHash = j.at("contentHash").get<std::string>();
  if (j.contains("usageLimit") && !j.at("usageLimit").is_null())
    r.usageLimit = j.at("usageLimit").get<unsigned int>();
  if (j.contains("ttlHours") && !j.at("ttlHours").is_null())
    r.ttlHours = j.at("ttlHours").get<unsigned int>();
  if (j.contains("reuseFileId") && !j.at("reuseFileId").is_null())
    r.reuseFileId = j.at("reuseFileId").get<std::string>();
}

void to_json(json &j, const CreateCodeResult &r) {
  if (r.conflict) {
    j = json{{"duplicate", true},
             {"error", "DUPLICATE_CONTENT"},
             {"message", "Identical content was already shared"},
             {"fileId", r.conflict->fileId},
             {"lookupCode", r.conflict->lookupCode},
             {"expiresAt", r.conflict->expiresAt},
             {"uploadComplete", r.conflict->uploadComplete}};
    return;
  }
  j = json{{"duplicate", false},     {"lookupCode", r.lookupCode},
           {"fileId", r.fileId},     {"expiresAt", r.expiresAt},
           {"usageLimit", r.usageLimit}, {"reused", r.reused}};
}

void from_json(const json &j, CreateCodeResult &r) {
  if (j.value("duplicate", false)) {
    DuplicateConflict c;
    c.fileId = j.at("fileId").get<std::string>();
    c.lookupCode = j.value("lookupCode", std::string());
    c.expiresAt = j.value("expiresAt", std::int64_t{0});
    c.uploadComplete = j.value("uploadComplete", true);
    r.conflict = c;
    return;
  }
  r.lookupCode = j.at("lookupCode").get<std::string>();
  r.fileId = j.at("fileId").get<std::string>();
  r.expiresAt = j.at("expiresAt").get<std::int64_t>();
  r.usageLimit = j.value("usageLimit", 0u);
  r.reused = j.value("reused", false);
}

void to_json(json &j, const UploadManifest &m) {
  j = json{{"totalChunks", m.totalChunks},
           {"size", m.fileSize},
           {"chunkSize", m.chunkSize}};
}

void from_json(const json &j, UploadManifest &m) {
  m.totalChunks = j.at("totalChunks").get<std::size_t>();
  m.fileSize = j.at("size").get<std::uint64_t>();
  m.chunkSize = j.value("chunkSize", std::size_t{0});
}

void to_json(json &j, const FileInfo &f) {
  j = json{{"name", f.fileName},           {"size", f.fileSize},
           {"mimeType", f.mimeType},       {"totalChunks", f.totalChunks},
           {"chunkSize", f.chunkSize}};
}

void from_json(const json &j, FileInfo &f) {
  f.fileName = j.at("name").get<std::string>();
  f.fileSize = j.at("size").get<std::uint64_t>();
  f.mimeType = j.value("mimeType", std::string("application/octet-stream"));
  f.totalChunks = j.at("totalChunks").get<std::size_t>();
  f.chunkSize = j.value("chunkSize", std::size_t{0});
}

void to_json(json &j, const DownloadCompletion &d) {
  j = json{{"usedCount", d.usedCount},
           {"usageLimit", d.usageLimit},
           {"status", codeStatusName(d.status)}};
}

void from_json(const json &j, DownloadCompletion &d) {
  d.usedCount = j.at("usedCount").get<unsigned int>();
  d.usageLimit = j.at("usageLimit").get<unsigned int>();
  d.status = codeStatusFromName(j.at("status").get<std::string>());
}

void to_json(json &j, const CodeStatusView &v) {
  j = json{{"lookupCode", v.lookupCode}, {"fileId", v.fileId},
           {"status", codeStatusName(v.status)},
           {"usedCount", v.usedCount},   {"usageLimit", v.usageLimit},
           {"createdAt", v.createdAt},   {"expiresAt", v.expiresAt},
           {"name", v.fileName},         {"size", v.fileSize},
           {"totalChunks", v.totalChunks}};
}

void from_json(const json &j, CodeStatusView &v) {
  v.lookupCode = j.at("lookupCode").get<std::string>();
  v.fileId = j.value("fileId", std::string());
  v.status = codeStatusFromName(j.at("status").get<std::string>());
  v.usedCount = j.value("usedCount", 0u);
  v.usageLimit = j.value("usageLimit", 0u);
  v.createdAt = j.value("createdAt", std::int64_t{0});
  v.expiresAt = j.value("expiresAt", std::int64_t{0});
  v.fileName = j.value("name", std::string());
  v.fileSize = j.value("size", std::uint64_t{0});
  v.totalChunks = j.value("totalChunks", std::size_t{0});
}

void to_json(json &j, const ChunkBatch &b) {
  json chunks = json::object();
  for (const auto &kv : b.chunks) {
    chunks[std::to_string(kv.first)] = encodeBase64(kv.second);
  }
  j = json{{"found", chunks}, {"missing", b.missing}, {"expired", b.expired}};
}

void from_json(const json &j, ChunkBatch &b) {
  for (const auto &item : j.at("found").items()) {
    std::size_t index = 0;
    try {
      index = static_cast<std::size_t>(std::stoull(item.key()));
    } catch (const std::exception &) {
      throw RelayError(ErrorCode::InvalidRequest,
                       "Bad chunk index '" + item.key() + "'");
    }
    b.chunks.emplace(index, decodeBase64(item.value().get<std::string>()));
  }
  b.missing = j.value("missing", std::vector<std::size_t>{});
  b.expired = j.value("expired", std::vector<std::size_t>{});
}

template <typename T> T parseBody(const std::string &body) {
  try {
    return json::parse(body).get<T>();
  } catch (const json::exception &e) {
    throw RelayError(ErrorCode::InvalidRequest,
                     std::string("Malformed request body: ") + e.what());
  }
}

template CreateCodeRequest parseBody<CreateCodeRequest>(const std::string &);
template CreateCodeResult parseBody<CreateCodeResult>(const std::string &);
template UploadManifest parseBody<UploadManifest>(const std::string &);
template FileInfo parseBody<FileInfo>(const std::string &);
template DownloadCompletion parseBody<DownloadCompletion>(const std::string &);
template CodeStatusView parseBody<CodeStatusView>(const std::string &);
template ChunkBatch parseBody<ChunkBatch>(const std::string &);

} // namespace quickshare::relay

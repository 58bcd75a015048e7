#ifndef QUICKSHARE_WIRE_FORMAT_HPP
#define QUICKSHARE_WIRE_FORMAT_HPP

#include "relay/relay_types.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quickshare::relay {

/** Standard (padded) base64 of binary payloads carried in JSON. */
std::string encodeBase64(const std::vector<std::byte> &data);

/** @throw RelayError(InvalidRequest) on malformed input. */
std::vector<std::byte> decodeBase64(const std::string &text);

// nlohmann::json ADL hooks. Field names are the relay's JSON API.
void to_json(nlohmann::json &j, const CreateCodeRequest &r);
void from_json(const nlohmann::json &j, CreateCodeRequest &r);
void to_json(nlohmann::json &j, const CreateCodeResult &r);
void from_json(const nlohmann::json &j, CreateCodeResult &r);
void to_json(nlohmann::json &j, const UploadManifest &m);
void from_json(const nlohmann::json &j, UploadManifest &m);
void to_json(nlohmann::json &j, const FileInfo &f);
void from_json(const nlohmann::json &j, FileInfo &f);
void to_json(nlohmann::json &j, const DownloadCompletion &d);
void from_json(const nlohmann::json &j, DownloadCompletion &d);
void to_json(nlohmann::json &j, const CodeStatusView &v);
void from_json(const nlohmann::json &j, CodeStatusView &v);
void to_json(nlohmann::json &j, const ChunkBatch &b);
void from_json(const nlohmann::json &j, ChunkBatch &b);

/**
 * @brief Parse a JSON request body.
 * @throw RelayError(InvalidRequest) if the body is not valid JSON or a field
 *        has the wrong type.
 */
template <typename T> T parseBody(const std::string &body);

} // namespace quickshare::relay

#endif // QUICKSHARE_WIRE_FORMAT_HPP

#include "utilities/relay_error.hpp"

#include <unordered_map>

namespace quickshare {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidRequest:
    return "INVALID_REQUEST";
  case ErrorCode::CodeNotFound:
    return "CODE_NOT_FOUND";
  case ErrorCode::CodeExpired:
    return "CODE_EXPIRED";
  case ErrorCode::CodeCompleted:
    return "CODE_COMPLETED";
  case ErrorCode::CodeInvalidated:
    return "CODE_INVALIDATED";
  case ErrorCode::KeyNotReady:
    return "KEY_NOT_READY";
  case ErrorCode::SenderNotFinished:
    return "SENDER_NOT_FINISHED";
  case ErrorCode::KeyUnwrapError:
    return "KEY_UNWRAP_ERROR";
  case ErrorCode::ChunkAuthError:
    return "CHUNK_AUTH_ERROR";
  case ErrorCode::ChunkMissing:
    return "CHUNK_MISSING";
  case ErrorCode::ChunkExpired:
    return "CHUNK_EXPIRED";
  case ErrorCode::UploadFailed:
    return "UPLOAD_FAILED";
  case ErrorCode::DuplicateContent:
    return "DUPLICATE_CONTENT";
  case ErrorCode::Unauthorized:
    return "UNAUTHORIZED";
  case ErrorCode::Forbidden:
    return "FORBIDDEN";
  case ErrorCode::TransferCancelled:
    return "TRANSFER_CANCELLED";
  case ErrorCode::TransportError:
    return "TRANSPORT_ERROR";
  case ErrorCode::Internal:
    break;
  }
  return "INTERNAL";
}

ErrorCode errorCodeFromName(const std::string &name) {
  static const std::unordered_map<std::string, ErrorCode> byName = [] {
    std::unordered_map<std::string, ErrorCode> m;
    for (int i = 0; i <= static_cast<int>(ErrorCode::Internal); ++i) {
      auto code = static_cast<ErrorCode>(i);
      m.emplace(errorCodeName(code), code);
    }
    return m;
  }();
  auto it = byName.find(name);
  return it == byName.end() ? ErrorCode::Internal : it->second;
}

int httpStatusFor(ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidRequest:
  case ErrorCode::UploadFailed:
    return 400;
  case ErrorCode::Unauthorized:
    return 401;
  case ErrorCode::Forbidden:
    return 403;
  case ErrorCode::CodeNotFound:
  case ErrorCode::KeyNotReady:
  case ErrorCode::ChunkMissing:
    return 404;
  case ErrorCode::DuplicateContent:
    return 409;
  case ErrorCode::CodeExpired:
  case ErrorCode::CodeCompleted:
  case ErrorCode::CodeInvalidated:
  case ErrorCode::ChunkExpired:
    return 410;
  default:
    return 500;
  }
}

bool isTerminalCodeState(ErrorCode code) {
  return code == ErrorCode::CodeExpired || code == ErrorCode::CodeCompleted ||
         code == ErrorCode::CodeInvalidated;
}

} // namespace quickshare

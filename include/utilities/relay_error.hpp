#ifndef QUICKSHARE_RELAY_ERROR_HPP
#define QUICKSHARE_RELAY_ERROR_HPP

#include <stdexcept>
#include <string>

namespace quickshare {

/**
 * @brief Failure reasons shared by the relay server and the transfer client.
 *
 * The same code travels over the wire as a stable reason string so a receiver
 * can tell a wrong pickup code, an expired code, a used-up code and a
 * storage/network fault apart regardless of transport.
 */
enum class ErrorCode {
  InvalidRequest,
  CodeNotFound,
  CodeExpired,
  CodeCompleted,
  CodeInvalidated,
  KeyNotReady,
  SenderNotFinished,
  KeyUnwrapError,
  ChunkAuthError,
  ChunkMissing,
  ChunkExpired,
  UploadFailed,
  DuplicateContent,
  Unauthorized,
  Forbidden,
  TransferCancelled,
  TransportError,
  Internal
};

/** Stable upper-case reason string, e.g. "KEY_NOT_READY". */
const char *errorCodeName(ErrorCode code);

/** Inverse of errorCodeName(); unknown names map to Internal. */
ErrorCode errorCodeFromName(const std::string &name);

/** HTTP status used when the error is returned by the relay server. */
int httpStatusFor(ErrorCode code);

/** True for the terminal registry states (expired, completed, invalidated). */
bool isTerminalCodeState(ErrorCode code);

class RelayError : public std::runtime_error {
public:
  RelayError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }
  const char *reason() const noexcept { return errorCodeName(code_); }

private:
  ErrorCode code_;
};

} // namespace quickshare

#endif // QUICKSHARE_RELAY_ERROR_HPP

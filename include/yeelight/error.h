#pragma once

#include <functional>
#include <string>

namespace yeelight {

/**
 * Optional sink for library log messages. When unset, messages go to stderr.
 */
using LogCallback = std::function<void(const std::string&)>;

/**
 * Error codes reported by public operations.
 */
enum class ErrorCode {
  kNone = 0,

  // Discovery
  kSocketError,
  kDiscoveryFailed,
  kCancelled,

  // Connection
  kConnectTimeout,
  kConnectionRefused,
  kConnectionLost,
  kNotConnected,
  kInvalidState,

  // Protocol
  kMalformedFrame,
  kUnknownResponseId,
  kDecodeFailure,

  // Command
  kDeviceError,
  kTimeout,

  // Sync
  kMemberUnreachable,
  kInvalidGroup,

  // Config / storage
  kInvalidConfig,
  kInvalidArgument,
  kStorageError,
  kNotFound,
};

/**
 * Coarse grouping of error codes by the layer that produced them.
 */
enum class ErrorCategory {
  kNone,
  kDiscovery,
  kConnection,
  kProtocol,
  kCommand,
  kSync,
  kConfig,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  bool ok() const { return code == ErrorCode::kNone; }
  ErrorCategory category() const;
  /// "<code name>: <message>" for logging.
  std::string ToString() const;
};

/// Stable lowercase name of an error code (e.g. "connection_lost").
const char* ErrorCodeName(ErrorCode code);

/// Category an error code belongs to.
ErrorCategory CategoryOf(ErrorCode code);

/**
 * Fill an optional error out-parameter and return false.
 */
bool SetError(Error* error, ErrorCode code, const std::string& message);

}  // namespace yeelight

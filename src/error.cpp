#include "yeelight/error.h"

namespace yeelight {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kSocketError:
      return "socket_error";
    case ErrorCode::kDiscoveryFailed:
      return "discovery_failed";
    case ErrorCode::kCancelled:
      return "cancelled";
    case ErrorCode::kConnectTimeout:
      return "connect_timeout";
    case ErrorCode::kConnectionRefused:
      return "connection_refused";
    case ErrorCode::kConnectionLost:
      return "connection_lost";
    case ErrorCode::kNotConnected:
      return "not_connected";
    case ErrorCode::kInvalidState:
      return "invalid_state";
    case ErrorCode::kMalformedFrame:
      return "malformed_frame";
    case ErrorCode::kUnknownResponseId:
      return "unknown_response_id";
    case ErrorCode::kDecodeFailure:
      return "decode_failure";
    case ErrorCode::kDeviceError:
      return "device_error";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kMemberUnreachable:
      return "member_unreachable";
    case ErrorCode::kInvalidGroup:
      return "invalid_group";
    case ErrorCode::kInvalidConfig:
      return "invalid_config";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kStorageError:
      return "storage_error";
    case ErrorCode::kNotFound:
      return "not_found";
  }
  return "unknown";
}

ErrorCategory CategoryOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return ErrorCategory::kNone;
    case ErrorCode::kSocketError:
    case ErrorCode::kDiscoveryFailed:
    case ErrorCode::kCancelled:
      return ErrorCategory::kDiscovery;
    case ErrorCode::kConnectTimeout:
    case ErrorCode::kConnectionRefused:
    case ErrorCode::kConnectionLost:
    case ErrorCode::kNotConnected:
    case ErrorCode::kInvalidState:
      return ErrorCategory::kConnection;
    case ErrorCode::kMalformedFrame:
    case ErrorCode::kUnknownResponseId:
    case ErrorCode::kDecodeFailure:
      return ErrorCategory::kProtocol;
    case ErrorCode::kDeviceError:
    case ErrorCode::kTimeout:
      return ErrorCategory::kCommand;
    case ErrorCode::kMemberUnreachable:
    case ErrorCode::kInvalidGroup:
      return ErrorCategory::kSync;
    case ErrorCode::kInvalidConfig:
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kStorageError:
    case ErrorCode::kNotFound:
      return ErrorCategory::kConfig;
  }
  return ErrorCategory::kNone;
}

ErrorCategory Error::category() const { return CategoryOf(code); }

std::string Error::ToString() const {
  std::string out = ErrorCodeName(code);
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

bool SetError(Error* error, ErrorCode code, const std::string& message) {
  if (error) {
    error->code = code;
    error->message = message;
  }
  return false;
}

}  // namespace yeelight

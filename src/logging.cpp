#include "logging.h"

#include <iostream>

namespace yeelight {
namespace internal {

void LogMessage(const LogCallback& log_callback, const std::string& message) {
  if (log_callback) {
    log_callback(message);
    return;
  }
  std::cerr << "[yeelight] " << message << std::endl;
}

void LogCallbackError(const LogCallback& log_callback, const char* name) {
  std::string message = "callback threw exception: ";
  message += name;
  LogMessage(log_callback, message);
}

}  // namespace internal
}  // namespace yeelight

#pragma once

#include "yeelight/error.h"

#include <string>

namespace yeelight {
namespace internal {

/// Forward to the callback, or stderr with a "[yeelight]" prefix.
void LogMessage(const LogCallback& log_callback, const std::string& message);

void LogCallbackError(const LogCallback& log_callback, const char* name);

}  // namespace internal
}  // namespace yeelight

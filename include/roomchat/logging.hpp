#pragma once

#include <functional>
#include <string>

namespace roomchat {

// Levels for the logging callback
enum class LogLevel { debug = 0, info, warning, error };

// Signature of the logging callback accepted by NetworkClient and ChatSession.
using logger_t = std::function<void(LogLevel lvl, std::string msg)>;

}  // namespace roomchat

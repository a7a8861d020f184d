/// @file log.hpp
/// @brief Warning channel for recoverable configuration errors

#pragma once

#include <functional>
#include <string_view>

namespace tweenflow {

/// Receives warning messages instead of stderr
using WarningHandler = std::function<void(std::string_view message)>;

/// Reports a recoverable misuse (the offending call becomes a no-op).
/// Writes "[tweenflow] warning: <message>" to stderr unless a handler is installed.
void log_warning(std::string_view message);

/// Installs a process-wide warning handler. An empty handler restores stderr output.
void set_warning_handler(WarningHandler handler);

} // namespace tweenflow

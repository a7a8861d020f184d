/// @file log.cpp
/// @brief Implements the warning channel

#include "core/log.hpp"

#include <cstdio>
#include <utility>

namespace tweenflow {

namespace {

WarningHandler g_warning_handler;

} // namespace

void log_warning(std::string_view message) {
    if (g_warning_handler) {
        g_warning_handler(message);
        return;
    }
    std::fprintf(stderr, "[tweenflow] warning: %.*s\n", static_cast<int>(message.size()),
                 message.data());
}

void set_warning_handler(WarningHandler handler) { g_warning_handler = std::move(handler); }

} // namespace tweenflow

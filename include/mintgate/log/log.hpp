#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <mintgate/log/formatter.hpp>
#include <mintgate/log/frontend.hpp>

namespace mintgate::log {

/**
 * Start the logging backend and set the root logger level. Unknown level
 * names fall back to info. Safe to call more than once.
 */
void initialize( std::string_view level = "info" ) noexcept;
logger* instance() noexcept;

} // namespace mintgate::log

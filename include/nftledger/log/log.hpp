#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <nftledger/log/formatter.hpp>
#include <nftledger/log/frontend.hpp>

namespace nftledger::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Accepts trace, debug, info, warning, error and critical. Returns false for anything else and
 * leaves the level unchanged.
 */
bool set_level( std::string_view level ) noexcept;
bool valid_level( std::string_view level ) noexcept;

} // namespace nftledger::log

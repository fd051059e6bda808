#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace nftledger::encode {

/**
 * Lowercase hex without a prefix. Token ids are produced with this encoding.
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

} // namespace nftledger::encode

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

namespace nftledger::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

/**
 * BLAKE3 digest, computed on a thread local hasher.
 */
digest hash( const void* ptr, std::size_t len ) noexcept;
digest hash( std::string_view sv ) noexcept;
digest hash( std::span< const std::byte > s ) noexcept;

} // namespace nftledger::crypto

#include <nftledger/crypto/hash.hpp>
#include <nftledger/memory/memory.hpp>

#include <cstdint>

#include <blake3.h>

namespace nftledger::crypto {

namespace detail {

struct blake3
{
  blake3_hasher hasher{};

  blake3()
  {
    blake3_hasher_init( &hasher );
  }
};

} // namespace detail

// NOLINTBEGIN
thread_local static detail::blake3 blake3;

// NOLINTEND

digest hash( const void* ptr, std::size_t len ) noexcept
{
  blake3_hasher_reset( &blake3.hasher );
  blake3_hasher_update( &blake3.hasher, ptr, len );

  digest out;
  blake3_hasher_finalize( &blake3.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( std::string_view sv ) noexcept
{
  return hash( sv.data(), sv.size() );
}

digest hash( std::span< const std::byte > s ) noexcept
{
  return hash( s.data(), s.size() );
}

} // namespace nftledger::crypto

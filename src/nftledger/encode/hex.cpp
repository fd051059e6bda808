#include <nftledger/encode/hex.hpp>

#include <bit>
#include <string_view>

namespace nftledger::encode {

constexpr std::string_view hex_digits = "0123456789abcdef";
constexpr unsigned int nibble_bits    = 4;
constexpr unsigned int nibble_mask    = 0x0f;

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string out;
  out.reserve( s.size() * 2 );

  for( const auto& b: s )
  {
    auto c = std::bit_cast< unsigned char >( b );
    out.push_back( hex_digits[ c >> nibble_bits ] );
    out.push_back( hex_digits[ c & nibble_mask ] );
  }

  return out;
}

} // namespace nftledger::encode

#include <gtest/gtest.h>

#include <nftledger/encode/hex.hpp>
#include <nftledger/memory/memory.hpp>

using namespace std::string_view_literals;

constexpr std::array< std::uint8_t, 6 > data{ 4, 8, 15, 16, 23, 42 };
constexpr auto valid_hex_str = "04080f10172a"sv;

TEST( hex, encode )
{
  auto encoded_data = nftledger::encode::to_hex( nftledger::memory::as_bytes( data ) );

  EXPECT_EQ( encoded_data, valid_hex_str );
  EXPECT_EQ( nftledger::encode::to_hex( {} ), "" );
}

TEST( hex, lowercase_full_range )
{
  constexpr std::array< std::uint8_t, 4 > edges{ 0x00, 0x0a, 0xaf, 0xff };

  EXPECT_EQ( nftledger::encode::to_hex( nftledger::memory::as_bytes( edges ) ), "000aafff" );
}

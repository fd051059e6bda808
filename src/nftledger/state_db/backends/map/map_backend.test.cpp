// NOLINTBEGIN

#include <gtest/gtest.h>

#include <nftledger/state_db/backends/map/map_backend.hpp>

using nftledger::state_db::backends::map::map_backend;

TEST( map_backend, crud )
{
  map_backend backend;

  EXPECT_EQ( backend.size(), 0 );

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x01 } };
  EXPECT_FALSE( backend.get( key_1 ) );

  backend.put( std::vector< std::byte >( key_1 ), value_1 );
  EXPECT_EQ( backend.size(), 1 );
  if( auto value = backend.get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "backend did not return a value";

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 }, std::byte{ 0x12 } };
  backend.put( std::vector< std::byte >( key_1 ), std::vector< std::byte >( value_1a ) );
  EXPECT_EQ( backend.size(), 1 );
  if( auto value = backend.get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "backend did not return a value";

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 }, std::byte{ 0x21 } };
  backend.put( std::vector< std::byte >( key_2 ), value_2 );
  EXPECT_EQ( backend.size(), 2 );

  backend.remove( key_1 );
  EXPECT_EQ( backend.size(), 1 );
  EXPECT_FALSE( backend.get( key_1 ) );

  EXPECT_NO_THROW( backend.remove( { std::byte{ 0x04 } } ) );
  EXPECT_EQ( backend.size(), 1 );
}

TEST( map_backend, read_your_writes_in_batch )
{
  map_backend backend;
  std::vector< std::byte > key{ std::byte{ 0x02 } }, value{ std::byte{ 0x20 }, std::byte{ 0x21 } };

  backend.start_write_batch();
  backend.put( std::vector< std::byte >( key ), value );
  if( auto v = backend.get( key ); v )
    EXPECT_TRUE( std::ranges::equal( *v, value ) );
  else
    ADD_FAILURE() << "backend did not return a value inside a batch";

  backend.remove( key );
  EXPECT_FALSE( backend.get( key ) );
  backend.end_write_batch();

  EXPECT_EQ( backend.size(), 0 );
}

// NOLINTEND

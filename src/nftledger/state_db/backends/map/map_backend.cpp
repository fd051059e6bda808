#include <nftledger/state_db/backends/map/map_backend.hpp>

#include <utility>

namespace nftledger::state_db::backends::map {

void map_backend::put( std::vector< std::byte >&& key, std::span< const std::byte > value )
{
  put( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

void map_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  _map.insert_or_assign( std::move( key ), std::move( value ) );
}

std::optional< std::span< const std::byte > > map_backend::get( const std::vector< std::byte >& key ) const
{
  if( auto itr = _map.find( key ); itr != _map.end() )
    return std::span< const std::byte >( itr->second );

  return {};
}

void map_backend::remove( const std::vector< std::byte >& key )
{
  _map.erase( key );
}

std::uint64_t map_backend::size() const noexcept
{
  return _map.size();
}

void map_backend::start_write_batch() {}

void map_backend::end_write_batch() {}

} // namespace nftledger::state_db::backends::map

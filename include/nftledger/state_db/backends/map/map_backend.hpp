#pragma once

#include <map>

#include <nftledger/state_db/backends/backend.hpp>

namespace nftledger::state_db::backends::map {

using map_type = std::map< std::vector< std::byte >, std::vector< std::byte > >;

class map_backend final: public abstract_backend
{
public:
  map_backend()                                = default;
  map_backend( const map_backend& )            = default;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = default;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() final                         = default;

  // Modifiers
  void put( std::vector< std::byte >&& key, std::span< const std::byte > value ) final;
  void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) final;
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const final;
  void remove( const std::vector< std::byte >& key ) final;

  std::uint64_t size() const noexcept final;

  void start_write_batch() final;
  void end_write_batch() final;

private:
  map_type _map;
};

} // namespace nftledger::state_db::backends::map

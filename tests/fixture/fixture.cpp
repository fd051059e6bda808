// NOLINTBEGIN

#include <test/fixture.hpp>

#include <set>

#include <nftledger/log.hpp>

namespace test {

nftledger::registry::account host::get_caller()
{
  return caller;
}

std::uint64_t host::get_time()
{
  return time;
}

fixture::fixture( const std::string& name, const std::string& log_level ):
    _alice( make_account( "alice" ) ),
    _bob( make_account( "bob" ) ),
    _charlie( make_account( "charlie" ) ),
    _accounts{ _alice, _bob, _charlie }
{
  nftledger::log::initialize();
  nftledger::log::set_level( log_level );

  _backend  = std::make_shared< nftledger::state_db::backends::map::map_backend >();
  _store    = std::make_unique< nftledger::registry::state_store >( _backend );
  _registry = std::make_unique< nftledger::registry::registry >( *_store, _system, _events );

  _system.time = 1'700'000'000'000;
  as( _alice );

  LOG_INFO( nftledger::log::instance(), "Starting {} fixture", name );
}

fixture::~fixture()
{
  nftledger::log::instance()->flush_log();
}

nftledger::registry::account fixture::make_account( const std::string& seed )
{
  return nftledger::crypto::hash( seed );
}

void fixture::as( const nftledger::registry::account& caller )
{
  _system.caller = caller;
}

bool fixture::verify_consistency() const
{
  std::uint64_t supply = 0;
  std::set< nftledger::registry::token_id > seen;

  for( const auto& owner: _accounts )
  {
    auto balance = _registry->balance_of( owner );
    supply      += balance;

    for( std::uint64_t i = 0; i < balance; ++i )
    {
      auto id = _registry->get_token_by_index( owner, i );
      if( !id )
        return false;

      if( !seen.insert( *id ).second )
        return false;

      if( _registry->owner_of( *id ) != owner )
        return false;

      if( !_registry->token_meta( *id ) )
        return false;
    }

    if( _registry->get_token_by_index( owner, balance ) )
      return false;
  }

  return supply == _registry->total_supply();
}

} // namespace test

// NOLINTEND

#include <nftledger/registry/registry.hpp>

#include <set>
#include <string_view>
#include <utility>

#include <nftledger/log/log.hpp>

namespace nftledger::registry {

namespace {

log::hex as_hex( const account& a )
{
  return log::hex{ a.data(), a.size() };
}

std::error_code reject( std::string_view operation, registry_errc e )
{
  std::error_code ec = e;
  LOG_DEBUG( log::instance(), "Rejected {}: {}", operation, ec.message() );
  return ec;
}

} // namespace

registry::registry( ledger_store& store, system_interface& system, event_sink& sink ):
    _store( &store ),
    _system( &system ),
    _sink( &sink ),
    _generator( store )
{}

registry::registry( ledger_store& store, system_interface& system, event_sink& sink, hash_function hasher ):
    _store( &store ),
    _system( &system ),
    _sink( &sink ),
    _generator( store, std::move( hasher ) )
{}

std::error_code registry::init( const std::string& name, const std::string& symbol, const metadata& meta )
{
  if( _store->initialized() )
    return reject( "init", registry_errc::already_initialized );

  _store->begin_batch();
  _store->set_name( name );
  _store->set_symbol( symbol );
  _store->set_meta( meta );
  _store->set_total_supply( 0 );
  _store->set_nonce( 0 );
  _store->set_initialized( true );
  _store->end_batch();

  LOG_INFO( log::instance(), "Initialized registry {} ({})", name, symbol );
  return registry_errc::ok;
}

std::error_code registry::init( const settings& s )
{
  if( !log::set_level( s.log_level ) )
    LOG_WARNING( log::instance(), "Ignoring unknown log level: {}", s.log_level );

  return init( s.name, s.symbol, s.metadata );
}

std::string registry::name() const
{
  return _store->name();
}

std::string registry::symbol() const
{
  return _store->symbol();
}

metadata registry::meta() const
{
  return _store->meta();
}

std::uint64_t registry::total_supply() const
{
  return _store->total_supply();
}

std::uint64_t registry::balance_of( const account& owner ) const
{
  return _store->balance( owner );
}

std::optional< account > registry::owner_of( const token_id& id ) const
{
  return _store->owner( id );
}

std::optional< metadata > registry::token_meta( const token_id& id ) const
{
  return _store->token_meta( id );
}

std::optional< token_id > registry::get_token_by_index( const account& owner, std::uint64_t index ) const
{
  if( index >= _store->balance( owner ) )
    return {};

  return _store->token_by_index( owner, index );
}

bool registry::is_approved( const account& owner, const token_id& id, const account& spender ) const
{
  auto approved = _store->allowance( owner, id );
  return approved && *approved == spender;
}

std::optional< account > registry::get_approved( const account& owner, const token_id& id ) const
{
  return _store->allowance( owner, id );
}

void registry::set_meta( const metadata& meta )
{
  _store->set_meta( meta );
  LOG_DEBUG( log::instance(), "Updated registry metadata" );
}

std::error_code registry::set_token_meta( const token_id& id, const metadata& meta )
{
  if( !_store->owner( id ) )
    return reject( "set_token_meta", registry_errc::token_id_doesnt_exist );

  _store->begin_batch();
  _store->set_token_meta( id, meta );
  _store->end_batch();

  _sink->emit( metadata_update_event{ .id = id } );
  LOG_DEBUG( log::instance(), "Updated metadata of token {}", id );
  return registry_errc::ok;
}

result< token_ids >
registry::mint( const account& recipient, const std::optional< token_ids >& ids, std::vector< metadata > metas )
{
  token_ids minted;

  if( ids )
  {
    if( ids->size() != metas.size() )
      return std::unexpected( reject( "mint", registry_errc::wrong_arguments ) );

    if( !_generator.validate_unique( *ids ) )
      return std::unexpected( reject( "mint", registry_errc::token_id_already_exists ) );

    minted = *ids;
  }
  else
  {
    if( metas.empty() )
      metas.emplace_back();

    minted = _generator.generate( _system->get_time(), metas.size() );

    // The nonce stays advanced, the next attempt derives fresh ids
    if( !_generator.validate_unique( minted ) )
      return std::unexpected( reject( "mint", registry_errc::token_id_already_exists ) );
  }

  _store->begin_batch();

  for( std::size_t i = 0; i < minted.size(); ++i )
  {
    _store->set_token_meta( minted[ i ], metas[ i ] );
    _store->set_owner( minted[ i ], recipient );
    _store->append_token( recipient, minted[ i ] );
  }

  _store->set_total_supply( _store->total_supply() + minted.size() );
  _store->end_batch();

  _sink->emit( mint_event{ .recipient = recipient, .ids = minted } );
  LOG_DEBUG( log::instance(), "Minted {} token(s) to {}: {}", minted.size(), as_hex( recipient ), minted );
  return minted;
}

result< token_ids > registry::mint_copies( const account& recipient,
                                           const std::optional< token_ids >& ids,
                                           const metadata& meta,
                                           std::uint32_t count )
{
  if( ids && ids->size() != count )
    return std::unexpected( reject( "mint_copies", registry_errc::wrong_arguments ) );

  return mint( recipient, ids, std::vector< metadata >( count, meta ) );
}

std::error_code registry::validate_owned( const account& owner, std::span< const token_id > ids ) const
{
  std::set< std::string_view > seen;

  for( const auto& id: ids )
  {
    if( !seen.insert( id ).second )
      return registry_errc::wrong_arguments;

    auto current = _store->owner( id );
    if( !current )
      return registry_errc::token_id_doesnt_exist;

    if( *current != owner )
      return registry_errc::permission_denied;
  }

  return registry_errc::ok;
}

std::error_code registry::burn( const account& owner, std::span< const token_id > ids )
{
  auto caller = _system->get_caller();

  if( caller != owner )
  {
    for( const auto& id: ids )
    {
      if( !is_approved( owner, id, caller ) )
        return reject( "burn", registry_errc::permission_denied );
    }
  }

  return burn_internal( owner, ids );
}

std::error_code registry::burn_internal( const account& owner, std::span< const token_id > ids )
{
  if( auto ec = validate_owned( owner, ids ); ec )
    return reject( "burn", static_cast< registry_errc >( ec.value() ) );

  _store->begin_batch();

  for( const auto& id: ids )
  {
    _store->remove_token( owner, id );
    _store->remove_token_meta( id );
    _store->remove_owner( id );
    _store->remove_allowance( owner, id );
  }

  _store->set_total_supply( _store->total_supply() - ids.size() );
  _store->end_batch();

  token_ids burned( ids.begin(), ids.end() );
  LOG_DEBUG( log::instance(), "Burned {} token(s) of {}: {}", burned.size(), as_hex( owner ), burned );
  _sink->emit( burn_event{ .owner = owner, .ids = std::move( burned ) } );
  return registry_errc::ok;
}

std::error_code registry::approve( const account& spender, std::span< const token_id > ids )
{
  auto caller = _system->get_caller();

  for( const auto& id: ids )
  {
    auto current = _store->owner( id );
    if( !current )
      return reject( "approve", registry_errc::wrong_arguments );

    if( *current != caller )
      return reject( "approve", registry_errc::permission_denied );
  }

  _store->begin_batch();

  for( const auto& id: ids )
    _store->set_allowance( caller, id, spender );

  _store->end_batch();

  token_ids approved( ids.begin(), ids.end() );
  LOG_DEBUG( log::instance(),
             "Approved {} for {} token(s) of {}",
             as_hex( spender ),
             approved.size(),
             as_hex( caller ) );
  _sink->emit( approve_event{ .owner = caller, .spender = spender, .ids = std::move( approved ) } );
  return registry_errc::ok;
}

std::error_code registry::transfer( const account& recipient, std::span< const token_id > ids )
{
  return transfer_from( _system->get_caller(), recipient, ids );
}

std::error_code registry::transfer_from( const account& owner, const account& recipient, std::span< const token_id > ids )
{
  auto caller = _system->get_caller();

  if( caller != owner )
  {
    for( const auto& id: ids )
    {
      if( !is_approved( owner, id, caller ) )
        return reject( "transfer_from", registry_errc::permission_denied );
    }
  }

  return transfer_from_internal( owner, recipient, ids );
}

std::error_code
registry::transfer_from_internal( const account& owner, const account& recipient, std::span< const token_id > ids )
{
  if( auto ec = validate_owned( owner, ids ); ec )
    return reject( "transfer", static_cast< registry_errc >( ec.value() ) );

  apply_transfer( owner, recipient, ids );
  return registry_errc::ok;
}

void registry::apply_transfer( const account& owner, const account& recipient, std::span< const token_id > ids )
{
  _store->begin_batch();

  // Allowances granted by the previous owner do not survive the move
  for( const auto& id: ids )
  {
    _store->remove_allowance( owner, id );
    _store->remove_token( owner, id );
    _store->append_token( recipient, id );
    _store->set_owner( id, recipient );
  }

  _store->end_batch();

  token_ids transferred( ids.begin(), ids.end() );
  LOG_DEBUG( log::instance(),
             "Transferred {} token(s) from {} to {}: {}",
             transferred.size(),
             as_hex( owner ),
             as_hex( recipient ),
             transferred );
  _sink->emit( transfer_event{ .sender = owner, .recipient = recipient, .ids = std::move( transferred ) } );
}

token_id_generator& registry::generator() noexcept
{
  return _generator;
}

} // namespace nftledger::registry

#include <nftledger/registry/state_store.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/endian.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>

#include <nftledger/memory/memory.hpp>

namespace nftledger::registry {

namespace key {

enum class scalar : std::uint8_t
{
  initialized,
  name,
  symbol,
  meta,
  total_supply,
  nonce
};

static std::vector< std::byte > make( scalar s )
{
  return make_key( space::scalar, memory::as_bytes( s ) );
}

static std::vector< std::byte > position( std::uint64_t index )
{
  boost::endian::native_to_little_inplace( index );
  auto bytes = memory::as_bytes( index );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

} // namespace key

namespace {

std::vector< std::byte > serialize( const metadata& meta )
{
  std::stringstream ss;
  boost::archive::binary_oarchive oa( ss, boost::archive::no_header | boost::archive::no_tracking );
  oa << meta;

  auto view  = ss.view();
  auto bytes = memory::as_bytes( view );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

metadata deserialize( std::span< const std::byte > bytes )
{
  std::stringstream ss{ std::string( memory::as_string_view( bytes ) ) };
  boost::archive::binary_iarchive ia( ss, boost::archive::no_header | boost::archive::no_tracking );

  metadata meta;
  ia >> meta;
  return meta;
}

std::optional< account > to_account( std::optional< std::span< const std::byte > > bytes )
{
  if( !bytes )
    return {};

  return memory::bit_cast< account >( *bytes );
}

std::vector< std::byte > from_account( const account& a )
{
  return std::vector< std::byte >( a.begin(), a.end() );
}

} // namespace

std::vector< std::byte > make_key( space s, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( s ) + key.size() );
  compound_key.push_back( static_cast< std::byte >( s ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

std::vector< std::byte >
make_key( space s, std::span< const std::byte > prefix, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( sizeof( s ) + prefix.size() + key.size() );
  compound_key.push_back( static_cast< std::byte >( s ) );
  std::ranges::copy( prefix, std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

state_store::state_store( state_db::backend_ptr backend ):
    _backend( std::move( backend ) )
{
  if( !_backend )
    throw std::invalid_argument( "state store requires a backend" );
}

const state_db::backend_ptr& state_store::backend() const noexcept
{
  return _backend;
}

std::uint64_t state_store::get_integer( const std::vector< std::byte >& key ) const
{
  auto object = _backend->get( key );
  if( !object )
    return 0;

  return boost::endian::little_to_native( memory::bit_cast< std::uint64_t >( *object ) );
}

void state_store::put_integer( std::vector< std::byte >&& key, std::uint64_t value )
{
  boost::endian::native_to_little_inplace( value );
  _backend->put( std::move( key ), memory::as_bytes( value ) );
}

bool state_store::initialized() const
{
  return _backend->get( key::make( key::scalar::initialized ) ).has_value();
}

void state_store::set_initialized( bool initialized )
{
  if( initialized )
    _backend->put( key::make( key::scalar::initialized ), std::vector< std::byte >{ std::byte{ 1 } } );
  else
    _backend->remove( key::make( key::scalar::initialized ) );
}

std::string state_store::name() const
{
  if( auto object = _backend->get( key::make( key::scalar::name ) ); object )
    return std::string( memory::as_string_view( *object ) );

  return {};
}

void state_store::set_name( const std::string& name )
{
  _backend->put( key::make( key::scalar::name ), memory::as_bytes( name ) );
}

std::string state_store::symbol() const
{
  if( auto object = _backend->get( key::make( key::scalar::symbol ) ); object )
    return std::string( memory::as_string_view( *object ) );

  return {};
}

void state_store::set_symbol( const std::string& symbol )
{
  _backend->put( key::make( key::scalar::symbol ), memory::as_bytes( symbol ) );
}

metadata state_store::meta() const
{
  if( auto object = _backend->get( key::make( key::scalar::meta ) ); object )
    return deserialize( *object );

  return {};
}

void state_store::set_meta( const metadata& meta )
{
  _backend->put( key::make( key::scalar::meta ), serialize( meta ) );
}

std::uint64_t state_store::total_supply() const
{
  return get_integer( key::make( key::scalar::total_supply ) );
}

void state_store::set_total_supply( std::uint64_t supply )
{
  put_integer( key::make( key::scalar::total_supply ), supply );
}

std::uint64_t state_store::nonce() const
{
  return get_integer( key::make( key::scalar::nonce ) );
}

void state_store::set_nonce( std::uint64_t nonce )
{
  put_integer( key::make( key::scalar::nonce ), nonce );
}

std::optional< account > state_store::owner( const token_id& id ) const
{
  return to_account( _backend->get( make_key( space::owners, memory::as_bytes( id ) ) ) );
}

void state_store::set_owner( const token_id& id, const account& owner )
{
  _backend->put( make_key( space::owners, memory::as_bytes( id ) ), from_account( owner ) );
}

void state_store::remove_owner( const token_id& id )
{
  _backend->remove( make_key( space::owners, memory::as_bytes( id ) ) );
}

std::uint64_t state_store::balance( const account& owner ) const
{
  return get_integer( make_key( space::balances, memory::as_bytes( owner ) ) );
}

std::optional< token_id > state_store::token_by_index( const account& owner, std::uint64_t index ) const
{
  auto object = _backend->get( make_key( space::owned_tokens, memory::as_bytes( owner ), key::position( index ) ) );
  if( !object )
    return {};

  return token_id( memory::as_string_view( *object ) );
}

void state_store::append_token( const account& owner, const token_id& id )
{
  auto index = balance( owner );

  _backend->put( make_key( space::owned_tokens, memory::as_bytes( owner ), key::position( index ) ),
                 memory::as_bytes( id ) );
  put_integer( make_key( space::owned_positions, memory::as_bytes( owner ), memory::as_bytes( id ) ), index );
  put_integer( make_key( space::balances, memory::as_bytes( owner ) ), index + 1 );
}

void state_store::remove_token( const account& owner, const token_id& id )
{
  auto position_key = make_key( space::owned_positions, memory::as_bytes( owner ), memory::as_bytes( id ) );
  if( !_backend->get( position_key ) )
    return;

  auto index = get_integer( position_key );
  auto last  = balance( owner ) - 1;

  if( index != last )
  {
    auto last_id = token_by_index( owner, last );
    if( !last_id )
      throw std::runtime_error( "owned token index is inconsistent" );

    _backend->put( make_key( space::owned_tokens, memory::as_bytes( owner ), key::position( index ) ),
                   memory::as_bytes( *last_id ) );
    put_integer( make_key( space::owned_positions, memory::as_bytes( owner ), memory::as_bytes( *last_id ) ), index );
  }

  _backend->remove( make_key( space::owned_tokens, memory::as_bytes( owner ), key::position( last ) ) );
  _backend->remove( position_key );

  if( last == 0 )
    _backend->remove( make_key( space::balances, memory::as_bytes( owner ) ) );
  else
    put_integer( make_key( space::balances, memory::as_bytes( owner ) ), last );
}

std::optional< metadata > state_store::token_meta( const token_id& id ) const
{
  if( auto object = _backend->get( make_key( space::token_metadata, memory::as_bytes( id ) ) ); object )
    return deserialize( *object );

  return {};
}

void state_store::set_token_meta( const token_id& id, const metadata& meta )
{
  _backend->put( make_key( space::token_metadata, memory::as_bytes( id ) ), serialize( meta ) );
}

void state_store::remove_token_meta( const token_id& id )
{
  _backend->remove( make_key( space::token_metadata, memory::as_bytes( id ) ) );
}

std::optional< account > state_store::allowance( const account& owner, const token_id& id ) const
{
  return to_account(
    _backend->get( make_key( space::allowances, memory::as_bytes( owner ), memory::as_bytes( id ) ) ) );
}

void state_store::set_allowance( const account& owner, const token_id& id, const account& spender )
{
  _backend->put( make_key( space::allowances, memory::as_bytes( owner ), memory::as_bytes( id ) ),
                 from_account( spender ) );
}

void state_store::remove_allowance( const account& owner, const token_id& id )
{
  _backend->remove( make_key( space::allowances, memory::as_bytes( owner ), memory::as_bytes( id ) ) );
}

void state_store::begin_batch()
{
  _backend->start_write_batch();
}

void state_store::end_batch()
{
  _backend->end_write_batch();
}

} // namespace nftledger::registry

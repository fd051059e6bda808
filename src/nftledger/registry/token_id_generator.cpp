#include <nftledger/registry/token_id_generator.hpp>

#include <algorithm>
#include <array>
#include <set>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <boost/endian.hpp>

#include <nftledger/encode/hex.hpp>
#include <nftledger/memory/memory.hpp>

namespace nftledger::registry {

static crypto::digest default_hash( std::span< const std::byte > bytes )
{
  return crypto::hash( bytes );
}

token_id_generator::token_id_generator( ledger_store& store ):
    token_id_generator( store, default_hash )
{}

token_id_generator::token_id_generator( ledger_store& store, hash_function hasher ):
    _store( &store ),
    _hasher( std::move( hasher ) )
{
  if( !_hasher )
    throw std::invalid_argument( "token id generator requires a hash function" );
}

token_ids token_id_generator::generate( std::uint64_t time, std::size_t n )
{
  auto nonce = _store->nonce();

  std::array< std::byte, sizeof( time ) + sizeof( nonce ) > preimage{};
  std::ranges::copy( memory::as_bytes( boost::endian::native_to_little( time ) ), preimage.begin() );

  token_ids ids;
  ids.reserve( n );

  for( auto i = nonce; i < nonce + n; ++i )
  {
    std::ranges::copy( memory::as_bytes( boost::endian::native_to_little( i ) ), preimage.begin() + sizeof( time ) );
    ids.emplace_back( encode::to_hex( _hasher( preimage ) ) );
  }

  _store->set_nonce( nonce + n );

  return ids;
}

bool token_id_generator::validate_unique( std::span< const token_id > ids ) const
{
  std::set< std::string_view > seen;

  for( const auto& id: ids )
  {
    if( !seen.insert( id ).second )
      return false;

    if( _store->owner( id ) )
      return false;
  }

  return true;
}

} // namespace nftledger::registry

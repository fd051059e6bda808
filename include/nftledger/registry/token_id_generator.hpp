#pragma once

#include <cstdint>
#include <functional>
#include <span>

#include <nftledger/crypto/hash.hpp>
#include <nftledger/registry/ledger_store.hpp>
#include <nftledger/registry/types.hpp>

namespace nftledger::registry {

using hash_function = std::function< crypto::digest( std::span< const std::byte > ) >;

/**
 * Derives token ids from the ledger nonce.
 *
 * The id for nonce value i at time t is the hex encoded hash of the 8 byte little endian t
 * followed by the 8 byte little endian i.
 */
class token_id_generator
{
public:
  explicit token_id_generator( ledger_store& store );
  token_id_generator( ledger_store& store, hash_function hasher );

  /**
   * Produces n ids and advances the stored nonce by n.
   */
  token_ids generate( std::uint64_t time, std::size_t n );

  /**
   * False if any id is live or appears twice in ids.
   */
  bool validate_unique( std::span< const token_id > ids ) const;

private:
  ledger_store* _store;
  hash_function _hasher;
};

} // namespace nftledger::registry

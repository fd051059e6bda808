#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <nftledger/registry/ledger_store.hpp>
#include <nftledger/state_db/backends/backend.hpp>

namespace nftledger::registry {

/**
 * Object spaces inside the backend. Every key is prefixed with its space.
 */
enum class space : std::uint8_t
{
  scalar,
  owners,
  owned_tokens,
  owned_positions,
  balances,
  token_metadata,
  allowances
};

std::vector< std::byte > make_key( space s, std::span< const std::byte > key );
std::vector< std::byte > make_key( space s, std::span< const std::byte > prefix, std::span< const std::byte > key );

/**
 * A ledger_store over a byte keyed backend.
 *
 * Integers are stored little endian, metadata through a Boost binary archive, names, symbols and
 * accounts as raw bytes.
 */
class state_store final: public ledger_store
{
public:
  explicit state_store( state_db::backend_ptr backend );
  ~state_store() final = default;

  bool initialized() const final;
  void set_initialized( bool ) final;

  std::string name() const final;
  void set_name( const std::string& name ) final;

  std::string symbol() const final;
  void set_symbol( const std::string& symbol ) final;

  metadata meta() const final;
  void set_meta( const metadata& meta ) final;

  std::uint64_t total_supply() const final;
  void set_total_supply( std::uint64_t supply ) final;

  std::uint64_t nonce() const final;
  void set_nonce( std::uint64_t nonce ) final;

  std::optional< account > owner( const token_id& id ) const final;
  void set_owner( const token_id& id, const account& owner ) final;
  void remove_owner( const token_id& id ) final;

  std::uint64_t balance( const account& owner ) const final;
  std::optional< token_id > token_by_index( const account& owner, std::uint64_t index ) const final;
  void append_token( const account& owner, const token_id& id ) final;
  void remove_token( const account& owner, const token_id& id ) final;

  std::optional< metadata > token_meta( const token_id& id ) const final;
  void set_token_meta( const token_id& id, const metadata& meta ) final;
  void remove_token_meta( const token_id& id ) final;

  std::optional< account > allowance( const account& owner, const token_id& id ) const final;
  void set_allowance( const account& owner, const token_id& id, const account& spender ) final;
  void remove_allowance( const account& owner, const token_id& id ) final;

  void begin_batch() final;
  void end_batch() final;

  const state_db::backend_ptr& backend() const noexcept;

private:
  std::uint64_t get_integer( const std::vector< std::byte >& key ) const;
  void put_integer( std::vector< std::byte >&& key, std::uint64_t value );

  state_db::backend_ptr _backend;
};

} // namespace nftledger::registry

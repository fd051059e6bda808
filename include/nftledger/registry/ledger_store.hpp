#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nftledger/registry/types.hpp>

namespace nftledger::registry {

/**
 * Ledger state of a registry.
 *
 * Owners, the owned token index, token metadata and allowances, plus the registry wide scalars.
 * The store applies writes as given, the registry is responsible for keeping the collections
 * consistent with each other.
 */
class ledger_store
{
public:
  ledger_store()                                 = default;
  ledger_store( const ledger_store& )            = delete;
  ledger_store( ledger_store&& )                 = delete;
  ledger_store& operator=( const ledger_store& ) = delete;
  ledger_store& operator=( ledger_store&& )      = delete;
  virtual ~ledger_store()                        = default;

  // Scalars
  virtual bool initialized() const     = 0;
  virtual void set_initialized( bool ) = 0;

  virtual std::string name() const                 = 0;
  virtual void set_name( const std::string& name ) = 0;

  virtual std::string symbol() const                   = 0;
  virtual void set_symbol( const std::string& symbol ) = 0;

  virtual metadata meta() const                 = 0;
  virtual void set_meta( const metadata& meta ) = 0;

  virtual std::uint64_t total_supply() const            = 0;
  virtual void set_total_supply( std::uint64_t supply ) = 0;

  virtual std::uint64_t nonce() const           = 0;
  virtual void set_nonce( std::uint64_t nonce ) = 0;

  // Owners
  virtual std::optional< account > owner( const token_id& id ) const = 0;
  virtual void set_owner( const token_id& id, const account& owner ) = 0;
  virtual void remove_owner( const token_id& id )                    = 0;

  // Owned token index

  /**
   * Number of tokens in the owner's index.
   */
  virtual std::uint64_t balance( const account& owner ) const = 0;

  virtual std::optional< token_id > token_by_index( const account& owner, std::uint64_t index ) const = 0;

  /**
   * Appends at index balance( owner ) and increments the balance.
   */
  virtual void append_token( const account& owner, const token_id& id ) = 0;

  /**
   * Moves the last token of the owner into the slot of the removed one and decrements the
   * balance. A token that is not in the index is ignored.
   */
  virtual void remove_token( const account& owner, const token_id& id ) = 0;

  // Token metadata
  virtual std::optional< metadata > token_meta( const token_id& id ) const = 0;
  virtual void set_token_meta( const token_id& id, const metadata& meta )  = 0;
  virtual void remove_token_meta( const token_id& id )                     = 0;

  // Allowances
  virtual std::optional< account > allowance( const account& owner, const token_id& id ) const   = 0;
  virtual void set_allowance( const account& owner, const token_id& id, const account& spender ) = 0;
  virtual void remove_allowance( const account& owner, const token_id& id )                      = 0;

  /**
   * Brackets the mutation pass of a registry operation.
   */
  virtual void begin_batch() = 0;
  virtual void end_batch()   = 0;
};

} // namespace nftledger::registry

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <nftledger/registry/error.hpp>
#include <nftledger/registry/event.hpp>
#include <nftledger/registry/ledger_store.hpp>
#include <nftledger/registry/settings.hpp>
#include <nftledger/registry/system_interface.hpp>
#include <nftledger/registry/token_id_generator.hpp>
#include <nftledger/registry/types.hpp>

namespace nftledger::registry {

/**
 * The non-fungible token ledger.
 *
 * Every mutating operation checks its whole batch before writing anything, so a call either
 * applies completely or returns an error with the ledger untouched. Calls must be serialized by
 * the host.
 */
class registry final
{
public:
  registry( ledger_store& store, system_interface& system, event_sink& sink );
  registry( ledger_store& store, system_interface& system, event_sink& sink, hash_function hasher );

  registry( const registry& )            = delete;
  registry( registry&& )                 = delete;
  registry& operator=( const registry& ) = delete;
  registry& operator=( registry&& )      = delete;
  ~registry()                            = default;

  std::error_code init( const std::string& name, const std::string& symbol, const metadata& meta );
  std::error_code init( const settings& s );

  std::string name() const;
  std::string symbol() const;
  metadata meta() const;
  std::uint64_t total_supply() const;
  std::uint64_t balance_of( const account& owner ) const;
  std::optional< account > owner_of( const token_id& id ) const;
  std::optional< metadata > token_meta( const token_id& id ) const;
  std::optional< token_id > get_token_by_index( const account& owner, std::uint64_t index ) const;
  bool is_approved( const account& owner, const token_id& id, const account& spender ) const;
  std::optional< account > get_approved( const account& owner, const token_id& id ) const;

  void set_meta( const metadata& meta );
  std::error_code set_token_meta( const token_id& id, const metadata& meta );

  /**
   * Mints one token per metadata entry. Without ids, fresh ids are generated and an empty
   * metas mints a single token with empty metadata.
   */
  result< token_ids >
  mint( const account& recipient, const std::optional< token_ids >& ids, std::vector< metadata > metas );

  result< token_ids > mint_copies( const account& recipient,
                                   const std::optional< token_ids >& ids,
                                   const metadata& meta,
                                   std::uint32_t count );

  std::error_code burn( const account& owner, std::span< const token_id > ids );

  /**
   * Burns without checking the caller.
   */
  std::error_code burn_internal( const account& owner, std::span< const token_id > ids );

  std::error_code approve( const account& spender, std::span< const token_id > ids );

  std::error_code transfer( const account& recipient, std::span< const token_id > ids );
  std::error_code transfer_from( const account& owner, const account& recipient, std::span< const token_id > ids );

  /**
   * Transfers without checking the caller.
   */
  std::error_code
  transfer_from_internal( const account& owner, const account& recipient, std::span< const token_id > ids );

  token_id_generator& generator() noexcept;

private:
  std::error_code validate_owned( const account& owner, std::span< const token_id > ids ) const;
  void apply_transfer( const account& owner, const account& recipient, std::span< const token_id > ids );

  ledger_store* _store;
  system_interface* _system;
  event_sink* _sink;
  token_id_generator _generator;
};

} // namespace nftledger::registry

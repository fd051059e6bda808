#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nftledger/crypto.hpp>
#include <nftledger/registry.hpp>
#include <nftledger/state_db.hpp>

namespace test {

class host final: public nftledger::registry::system_interface
{
public:
  nftledger::registry::account get_caller() override;
  std::uint64_t get_time() override;

  nftledger::registry::account caller{};
  std::uint64_t time = 0;
};

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static nftledger::registry::account make_account( const std::string& seed );

  /**
   * Sets the caller of the following registry calls.
   */
  void as( const nftledger::registry::account& caller );

  /**
   * Checks the supply and owned index invariants over every account in _accounts.
   */
  bool verify_consistency() const;

  std::shared_ptr< nftledger::state_db::backends::map::map_backend > _backend;
  std::unique_ptr< nftledger::registry::state_store > _store;
  host _system;
  nftledger::registry::event_recorder _events;
  std::unique_ptr< nftledger::registry::registry > _registry;

  nftledger::registry::account _alice;
  nftledger::registry::account _bob;
  nftledger::registry::account _charlie;
  std::vector< nftledger::registry::account > _accounts;
};

} // namespace test

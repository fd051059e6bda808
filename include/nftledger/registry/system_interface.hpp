#pragma once

#include <cstdint>

#include <nftledger/registry/types.hpp>

namespace nftledger::registry {

/**
 * The host environment of a registry call.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  /**
   * The authenticated principal performing the current call.
   */
  virtual account get_caller() = 0;

  /**
   * A coarse timestamp, only required to distinguish id generator invocations together with the
   * nonce.
   */
  virtual std::uint64_t get_time() = 0;
};

} // namespace nftledger::registry

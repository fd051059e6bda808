#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nftledger/state_db/types.hpp>

namespace nftledger::state_db::backends {

/**
 * Byte keyed associative storage.
 *
 * Implementations must give read-your-writes consistency: a get() following a put() or remove()
 * on the same key observes it, inside or outside a write batch.
 */
class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual void put( std::vector< std::byte >&& key, std::span< const std::byte > value ) = 0;
  virtual void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )   = 0;

  /**
   * The returned span is invalidated by the next modification of the backend.
   */
  virtual std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const = 0;

  /**
   * Removing an absent key is a no-op.
   */
  virtual void remove( const std::vector< std::byte >& key ) = 0;

  virtual std::uint64_t size() const = 0;

  virtual void start_write_batch() = 0;
  virtual void end_write_batch()   = 0;
};

} // namespace nftledger::state_db::backends

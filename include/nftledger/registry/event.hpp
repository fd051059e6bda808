#pragma once

#include <string_view>
#include <variant>
#include <vector>

#include <nftledger/registry/types.hpp>

namespace nftledger::registry {

struct mint_event
{
  account recipient{};
  token_ids ids;
};

struct burn_event
{
  account owner{};
  token_ids ids;
};

struct transfer_event
{
  account sender{};
  account recipient{};
  token_ids ids;
};

struct approve_event
{
  account owner{};
  account spender{};
  token_ids ids;
};

struct metadata_update_event
{
  token_id id;
};

using event = std::variant< mint_event, burn_event, transfer_event, approve_event, metadata_update_event >;

std::string_view event_name( const event& e ) noexcept;

/**
 * Receives registry events after the operation has been committed. An exception thrown by emit()
 * reaches the caller of the operation, the ledger change stands.
 */
class event_sink
{
public:
  event_sink()                               = default;
  event_sink( const event_sink& )            = delete;
  event_sink( event_sink&& )                 = delete;
  event_sink& operator=( const event_sink& ) = delete;
  event_sink& operator=( event_sink&& )      = delete;
  virtual ~event_sink()                      = default;

  virtual void emit( const event& e ) = 0;
};

class event_recorder final: public event_sink
{
public:
  event_recorder()           = default;
  ~event_recorder() override = default;

  void emit( const event& e ) override;

  const std::vector< event >& events() const noexcept;
  void clear() noexcept;

private:
  std::vector< event > _events;
};

} // namespace nftledger::registry

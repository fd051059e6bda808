#include <nftledger/registry/event.hpp>

#include <type_traits>

namespace nftledger::registry {

std::string_view event_name( const event& e ) noexcept
{
  return std::visit(
    []< typename T >( const T& ) -> std::string_view
    {
      if constexpr( std::is_same_v< T, mint_event > )
        return "mint";
      else if constexpr( std::is_same_v< T, burn_event > )
        return "burn";
      else if constexpr( std::is_same_v< T, transfer_event > )
        return "transfer";
      else if constexpr( std::is_same_v< T, approve_event > )
        return "approve";
      else
        return "metadata_update";
    },
    e );
}

void event_recorder::emit( const event& e )
{
  _events.push_back( e );
}

const std::vector< event >& event_recorder::events() const noexcept
{
  return _events;
}

void event_recorder::clear() noexcept
{
  _events.clear();
}

} // namespace nftledger::registry

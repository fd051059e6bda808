#include <nftledger/registry/error.hpp>

#include <string>
#include <utility>

namespace nftledger::registry {

struct _registry_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _registry_category::name() const noexcept
{
  return "registry";
}

std::string _registry_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< registry_errc >( condition ) )
  {
    case registry_errc::ok:
      return "ok"s;
    case registry_errc::permission_denied:
      return "permission denied"s;
    case registry_errc::wrong_arguments:
      return "wrong arguments"s;
    case registry_errc::token_id_already_exists:
      return "token id already exists"s;
    case registry_errc::token_id_doesnt_exist:
      return "token id does not exist"s;
    case registry_errc::already_initialized:
      return "already initialized"s;
  }
  std::unreachable();
}

const std::error_category& registry_category() noexcept
{
  static _registry_category category;
  return category;
}

std::error_code make_error_code( registry_errc e )
{
  return std::error_code( static_cast< int >( e ), registry_category() );
}

struct _settings_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _settings_category::name() const noexcept
{
  return "settings";
}

std::string _settings_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< settings_errc >( condition ) )
  {
    case settings_errc::ok:
      return "ok"s;
    case settings_errc::unreadable:
      return "unreadable settings"s;
    case settings_errc::missing_field:
      return "missing field"s;
    case settings_errc::invalid_field:
      return "invalid field"s;
  }
  std::unreachable();
}

const std::error_category& settings_category() noexcept
{
  static _settings_category category;
  return category;
}

std::error_code make_error_code( settings_errc e )
{
  return std::error_code( static_cast< int >( e ), settings_category() );
}

} // namespace nftledger::registry

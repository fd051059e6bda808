#pragma once

#include <expected>
#include <system_error>

namespace nftledger::registry {

enum class registry_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  permission_denied,
  wrong_arguments,
  token_id_already_exists,
  token_id_doesnt_exist,
  already_initialized
};

const std::error_category& registry_category() noexcept;

std::error_code make_error_code( registry_errc e );

enum class settings_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unreadable,
  missing_field,
  invalid_field
};

const std::error_category& settings_category() noexcept;

std::error_code make_error_code( settings_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace nftledger::registry

template<>
struct std::is_error_code_enum< nftledger::registry::registry_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< nftledger::registry::settings_errc >: public std::true_type
{};

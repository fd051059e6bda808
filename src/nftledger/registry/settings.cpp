#include <nftledger/registry/settings.hpp>

#include <utility>

#include <nftledger/log/log.hpp>

namespace nftledger::registry {

namespace constants {

constexpr auto name_field      = "name";
constexpr auto symbol_field    = "symbol";
constexpr auto metadata_field  = "metadata";
constexpr auto log_level_field = "log-level";

} // namespace constants

static result< std::string > required_scalar( const YAML::Node& node, const char* field )
{
  const auto& value = node[ field ];
  if( !value )
    return std::unexpected( settings_errc::missing_field );

  if( !value.IsScalar() )
    return std::unexpected( settings_errc::invalid_field );

  return value.as< std::string >();
}

result< settings > load_settings( const YAML::Node& node )
{
  if( !node.IsMap() )
    return std::unexpected( settings_errc::invalid_field );

  settings s;

  if( auto name = required_scalar( node, constants::name_field ); name )
    s.name = std::move( *name );
  else
    return std::unexpected( name.error() );

  if( auto symbol = required_scalar( node, constants::symbol_field ); symbol )
    s.symbol = std::move( *symbol );
  else
    return std::unexpected( symbol.error() );

  if( const auto& meta = node[ constants::metadata_field ]; meta )
  {
    if( !meta.IsMap() )
      return std::unexpected( settings_errc::invalid_field );

    for( const auto& entry: meta )
    {
      if( !entry.second.IsScalar() )
        return std::unexpected( settings_errc::invalid_field );

      s.metadata.insert_or_assign( entry.first.as< std::string >(), entry.second.as< std::string >() );
    }
  }

  if( const auto& level = node[ constants::log_level_field ]; level )
  {
    if( !level.IsScalar() || !log::valid_level( level.as< std::string >() ) )
      return std::unexpected( settings_errc::invalid_field );

    s.log_level = level.as< std::string >();
  }

  return s;
}

result< settings > load_settings( const std::filesystem::path& file )
{
  YAML::Node node;

  try
  {
    node = YAML::LoadFile( file.string() );
  }
  catch( const YAML::Exception& e )
  {
    LOG_WARNING( log::instance(), "Unable to read settings from {}: {}", file.string(), e.what() );
    return std::unexpected( settings_errc::unreadable );
  }

  return load_settings( node );
}

} // namespace nftledger::registry

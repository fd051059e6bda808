#pragma once

#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include <nftledger/registry/error.hpp>
#include <nftledger/registry/types.hpp>

namespace nftledger::registry {

struct settings
{
  std::string name;
  std::string symbol;
  nftledger::registry::metadata metadata;
  std::string log_level = "info";
};

/**
 * Reads settings from a node of the form
 *
 *   name: Kitties
 *   symbol: KTY
 *   metadata:
 *     origin: genesis
 *   log-level: debug
 *
 * name and symbol are required, metadata and log-level are optional.
 */
result< settings > load_settings( const YAML::Node& node );
result< settings > load_settings( const std::filesystem::path& file );

} // namespace nftledger::registry

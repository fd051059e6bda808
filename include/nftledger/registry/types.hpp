#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace nftledger::registry {

constexpr std::size_t account_length = 32;

using account  = std::array< std::byte, account_length >;
using token_id = std::string;
using metadata = std::map< std::string, std::string >;

using token_ids = std::vector< token_id >;

} // namespace nftledger::registry

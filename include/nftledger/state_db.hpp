#pragma once

#include <nftledger/state_db/backends/backend.hpp>
#include <nftledger/state_db/backends/map/map_backend.hpp>
#include <nftledger/state_db/types.hpp>

#pragma once

#include <nftledger/registry/error.hpp>
#include <nftledger/registry/event.hpp>
#include <nftledger/registry/ledger_store.hpp>
#include <nftledger/registry/registry.hpp>
#include <nftledger/registry/settings.hpp>
#include <nftledger/registry/state_store.hpp>
#include <nftledger/registry/system_interface.hpp>
#include <nftledger/registry/token_id_generator.hpp>
#include <nftledger/registry/types.hpp>

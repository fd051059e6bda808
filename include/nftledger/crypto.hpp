#pragma once

#include <nftledger/crypto/hash.hpp>

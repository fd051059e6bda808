#pragma once

#include <nftledger/log/log.hpp>

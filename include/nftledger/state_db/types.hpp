#pragma once

#include <memory>

namespace nftledger::state_db {

namespace backends {

class abstract_backend;

} // namespace backends

using backend_ptr = std::shared_ptr< backends::abstract_backend >;

} // namespace nftledger::state_db

#pragma once

#include <cstdint>
#include <memory>

#include <veiling/protocol/account.hpp>

namespace veiling::state_db {

class state_node;
class state_delta;

/**
 * Objects are partitioned by owner account and object id. System spaces hold
 * ledger metadata and are unreachable from programs.
 */
struct object_space
{
  bool system = false;
  protocol::account account{};
  std::uint32_t id = 0;
};

using state_node_ptr  = std::shared_ptr< state_node >;
using state_delta_ptr = std::shared_ptr< state_delta >;

} // namespace veiling::state_db

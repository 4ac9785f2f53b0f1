#pragma once

#include <cstdint>
#include <span>

#include <veiling/state_db.hpp>

namespace veiling::controller { namespace state {

namespace space {

const state_db::object_space& metadata();
const state_db::object_space& transaction_nonce();

} // namespace space

namespace key {

std::span< const std::byte > head_key();

} // namespace key

/**
 * The last applied block. Time is the ledger clock, in seconds.
 */
struct head
{
  std::uint64_t height = 0;
  std::uint64_t time   = 0;
};

}} // namespace veiling::controller::state

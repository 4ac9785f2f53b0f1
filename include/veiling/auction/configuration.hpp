#pragma once

#include <cstdint>

#include <veiling/auction/error.hpp>
#include <veiling/auction/store.hpp>
#include <veiling/protocol.hpp>

namespace veiling::auction {

struct configuration
{
  protocol::account admin{};
  protocol::address payment_asset{};
  protocol::address prize_asset{};
  protocol::amount starting_price;
  protocol::amount minimum_price;
  std::uint64_t start_time = 0;
  protocol::amount decay_rate;
};

/**
 * Reads every configuration field, failing with program_errc::uninitialized
 * when the auction has not been initialized.
 */
result< configuration > load( const store& s );

/**
 * Writes every configuration field. Fails with
 * program_errc::already_initialized when an admin is already stored, in which
 * case nothing is written.
 */
std::error_code save( store& s, const configuration& config );

} // namespace veiling::auction

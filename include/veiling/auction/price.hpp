#pragma once

#include <cstdint>

#include <veiling/auction/configuration.hpp>
#include <veiling/auction/error.hpp>
#include <veiling/protocol.hpp>

namespace veiling::auction {

/**
 * The price drops by one unit every decay_rate seconds after start_time and
 * never below minimum_price. Times before start_time are priced as
 * start_time.
 *
 * Fails with program_errc::invalid_decay_rate when decay_rate is not
 * positive.
 */
result< protocol::amount > compute_price( const configuration& config, std::uint64_t now );

} // namespace veiling::auction

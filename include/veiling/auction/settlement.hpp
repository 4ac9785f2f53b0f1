#pragma once

#include <veiling/auction/configuration.hpp>
#include <veiling/auction/error.hpp>
#include <veiling/program/system_interface.hpp>
#include <veiling/protocol.hpp>

namespace veiling::auction {

struct settlement_receipt
{
  protocol::amount price;
  protocol::amount prize;
};

/**
 * Sells the prize to buyer at the current price. The payment moves from the
 * buyer to the admin through the buyer's allowance, then the auction's whole
 * prize balance moves to the buyer.
 *
 * A rejected token call fails with program_errc::transfer_rejected. The
 * host reverts the payment when the prize transfer fails.
 */
result< settlement_receipt >
settle( program::system_interface* system, const configuration& config, const protocol::account& buyer );

} // namespace veiling::auction

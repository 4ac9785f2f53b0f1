#pragma once

#include <cstdint>
#include <vector>

#include <veiling/protocol/transaction.hpp>

namespace veiling::protocol {

/**
 * The timestamp is the ledger time, in seconds, observed by every
 * transaction in the block.
 */
struct block
{
  std::uint64_t height    = 0;
  std::uint64_t timestamp = 0;
  std::vector< transaction > transactions;

  bool validate() const noexcept;
};

struct block_receipt
{
  std::uint64_t height    = 0;
  std::uint64_t timestamp = 0;
  std::vector< transaction_receipt > transaction_receipts;
};

} // namespace veiling::protocol

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <veiling/protocol/account.hpp>
#include <veiling/protocol/program.hpp>

namespace veiling::protocol {

struct call_program
{
  account id{};
  program_input input;

  bool validate() const noexcept;
};

using operation = call_program;

/**
 * Signature verification happens before a transaction reaches the ledger.
 * The accounts listed in authorizations are treated as having signed it.
 */
struct transaction
{
  account payer{};
  std::uint64_t nonce = 0;
  std::vector< operation > operations;
  std::vector< account > authorizations;

  bool validate() const noexcept;
};

struct transaction_receipt
{
  account payer{};
  std::uint64_t nonce = 0;
  bool reverted       = false;
  std::error_code error;
  std::vector< std::shared_ptr< program_frame > > frames;
  std::vector< std::string > logs;
};

} // namespace veiling::protocol

template< typename T >
concept Operation = std::same_as< veiling::protocol::operation, T >;

template< typename T >
concept Transaction = std::same_as< veiling::protocol::transaction, T >;

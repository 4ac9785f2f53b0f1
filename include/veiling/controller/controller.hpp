#pragma once

#include <veiling/controller/error.hpp>
#include <veiling/controller/state.hpp>
#include <veiling/program.hpp>
#include <veiling/protocol.hpp>
#include <veiling/state_db.hpp>

#include <algorithm>
#include <map>
#include <memory>
#include <span>

namespace veiling::controller {

struct account_compare
{
  using is_transparent = void;

  bool operator()( std::span< const std::byte > lhs, std::span< const std::byte > rhs ) const
  {
    return std::ranges::lexicographical_compare( lhs, rhs );
  }
};

using program_registry = std::map< protocol::account, std::shared_ptr< program::program >, account_compare >;

/**
 * An in-process ledger. Blocks advance the clock, transactions apply
 * atomically against the committed state.
 */
class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  /**
   * Makes a program callable under a program account. Throws
   * std::invalid_argument when the account is not a program account or is
   * already taken.
   */
  void register_program( const protocol::account& account, std::shared_ptr< program::program > program );

  /**
   * Applies a block at its timestamp. Transactions reverted by a program are
   * kept in the receipt, any other failure rejects the whole block.
   */
  result< protocol::block_receipt > process( const protocol::block& block );

  /**
   * Applies a transaction at head time. A program failure discards every
   * write of the transaction and is returned as the error.
   */
  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  state::head head() const;

  result< protocol::program_output > read_program( const protocol::account& account,
                                                   const protocol::program_input& input = {} ) const;

  std::uint64_t account_nonce( const protocol::account& account ) const;

private:
  state_db::state_node_ptr _root;
  program_registry _programs;
};

} // namespace veiling::controller

#pragma once

#include <ranges>

#include <boost/endian.hpp>

#include <veiling/controller.hpp>
#include <veiling/memory.hpp>
#include <veiling/program.hpp>
#include <veiling/protocol.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace test {

using token_instruction   = veiling::program::token::instruction;
using auction_instruction = veiling::program::dutch_auction::instruction;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  veiling::protocol::operation make_call_operation( const veiling::protocol::account& id,
                                                    std::vector< std::byte >&& stdin ) const;

  veiling::protocol::operation make_mint_operation( const veiling::protocol::account& id,
                                                    const veiling::protocol::account& to,
                                                    const veiling::protocol::amount& value ) const;
  veiling::protocol::operation make_burn_operation( const veiling::protocol::account& id,
                                                    const veiling::protocol::account& from,
                                                    const veiling::protocol::amount& value ) const;
  veiling::protocol::operation make_transfer_operation( const veiling::protocol::account& id,
                                                        const veiling::protocol::account& from,
                                                        const veiling::protocol::account& to,
                                                        const veiling::protocol::amount& value ) const;
  veiling::protocol::operation make_approve_operation( const veiling::protocol::account& id,
                                                       const veiling::protocol::account& owner,
                                                       const veiling::protocol::account& spender,
                                                       const veiling::protocol::amount& value ) const;
  veiling::protocol::operation make_transfer_from_operation( const veiling::protocol::account& id,
                                                             const veiling::protocol::account& spender,
                                                             const veiling::protocol::account& from,
                                                             const veiling::protocol::account& to,
                                                             const veiling::protocol::amount& value ) const;

  veiling::protocol::operation make_initialize_operation( const veiling::protocol::account& id,
                                                          const veiling::protocol::account& admin,
                                                          const veiling::protocol::address& payment_asset,
                                                          const veiling::protocol::address& prize_asset,
                                                          const veiling::protocol::amount& starting_price,
                                                          const veiling::protocol::amount& minimum_price,
                                                          const veiling::protocol::amount& decay_rate ) const;
  veiling::protocol::operation make_buy_operation( const veiling::protocol::account& id,
                                                   const veiling::protocol::account& buyer ) const;

  template< Operation... Args >
  veiling::protocol::transaction
  make_transaction( const veiling::protocol::account& payer, std::uint64_t nonce, Args... args ) const
  {
    veiling::protocol::transaction t;
    ( ( t.operations.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.nonce = nonce;
    t.payer = payer;
    t.authorizations.emplace_back( payer );
    return t;
  }

  /**
   * Applies a transaction paid and authorized by payer using its next nonce.
   */
  template< Operation... Args >
  veiling::controller::result< veiling::protocol::transaction_receipt > submit( const veiling::protocol::account& payer,
                                                                                 Args... args )
  {
    return _controller->process(
      make_transaction( payer, _controller->account_nonce( payer ) + 1, std::forward< Args >( args )... ) );
  }

  template< Transaction... Args >
  veiling::protocol::block make_block( std::uint64_t timestamp, Args... args ) const
  {
    veiling::protocol::block b;
    ( ( b.transactions.emplace_back( std::forward< Args >( args ) ) ), ... );
    b.height    = _controller->head().height + 1;
    b.timestamp = timestamp;
    return b;
  }

  /**
   * Moves the ledger clock forward with an empty block.
   */
  bool advance( std::uint64_t timestamp );

  template< std::integral T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    boost::endian::native_to_little_inplace( t );
    const auto bytes = veiling::memory::as_bytes( std::addressof( t ), 1 );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< std::ranges::range T >
  void append_stdin( std::vector< std::byte >& input, const T& t ) const noexcept
  {
    const auto bytes = veiling::memory::as_bytes( t );
    input.insert( input.end(), bytes.begin(), bytes.end() );
  }

  template< typename T >
    requires std::is_enum_v< T >
  void append_stdin( std::vector< std::byte >& input, T t ) const noexcept
  {
    return append_stdin( input, std::to_underlying( t ) );
  }

  void append_stdin( std::vector< std::byte >& input, const veiling::protocol::amount& a ) const;

  template< typename... Args >
  std::vector< std::byte > make_stdin( Args... args ) const
  {
    std::vector< std::byte > input;
    ( ( append_stdin( input, std::forward< Args >( args ) ) ), ... );
    return input;
  }

  veiling::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                               std::vector< std::string >&& arguments = {} ) const noexcept;

  veiling::controller::result< veiling::protocol::amount > read_amount( const veiling::protocol::account& id,
                                                                        std::vector< std::byte >&& stdin ) const;
  veiling::controller::result< veiling::protocol::amount > balance_of( const veiling::protocol::account& token,
                                                                       const veiling::protocol::account& owner ) const;

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    head              = 1 << 1,
    without_reversion = 1 << 2
  };

  bool verify( veiling::controller::result< veiling::protocol::block_receipt > receipt, std::uint64_t flags ) const;
  bool verify( veiling::controller::result< veiling::protocol::transaction_receipt > receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< veiling::controller::controller > _controller;
};

} // namespace test

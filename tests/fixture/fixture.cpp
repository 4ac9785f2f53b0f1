// NOLINTBEGIN

#include <test/fixture.hpp>

#include <veiling/controller.hpp>
#include <veiling/encode.hpp>
#include <veiling/log.hpp>
#include <veiling/protocol.hpp>

#include <stdexcept>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  veiling::log::initialize( log_level );

  _controller = std::make_unique< veiling::controller::controller >();
  LOG_INFO( veiling::log::instance(), "Starting fixture: {}", name );
}

fixture::~fixture() = default;

veiling::protocol::operation fixture::make_call_operation( const veiling::protocol::account& id,
                                                           std::vector< std::byte >&& stdin ) const
{
  veiling::protocol::call_program op;
  op.id          = id;
  op.input.stdin = std::move( stdin );
  return op;
}

veiling::protocol::operation fixture::make_mint_operation( const veiling::protocol::account& id,
                                                           const veiling::protocol::account& to,
                                                           const veiling::protocol::amount& value ) const
{
  return make_call_operation( id, make_stdin( token_instruction::mint, to, value ) );
}

veiling::protocol::operation fixture::make_burn_operation( const veiling::protocol::account& id,
                                                           const veiling::protocol::account& from,
                                                           const veiling::protocol::amount& value ) const
{
  return make_call_operation( id, make_stdin( token_instruction::burn, from, value ) );
}

veiling::protocol::operation fixture::make_transfer_operation( const veiling::protocol::account& id,
                                                               const veiling::protocol::account& from,
                                                               const veiling::protocol::account& to,
                                                               const veiling::protocol::amount& value ) const
{
  return make_call_operation( id, make_stdin( token_instruction::transfer, from, to, value ) );
}

veiling::protocol::operation fixture::make_approve_operation( const veiling::protocol::account& id,
                                                              const veiling::protocol::account& owner,
                                                              const veiling::protocol::account& spender,
                                                              const veiling::protocol::amount& value ) const
{
  return make_call_operation( id, make_stdin( token_instruction::approve, owner, spender, value ) );
}

veiling::protocol::operation fixture::make_transfer_from_operation( const veiling::protocol::account& id,
                                                                    const veiling::protocol::account& spender,
                                                                    const veiling::protocol::account& from,
                                                                    const veiling::protocol::account& to,
                                                                    const veiling::protocol::amount& value ) const
{
  return make_call_operation( id, make_stdin( token_instruction::transfer_from, spender, from, to, value ) );
}

veiling::protocol::operation fixture::make_initialize_operation( const veiling::protocol::account& id,
                                                                 const veiling::protocol::account& admin,
                                                                 const veiling::protocol::address& payment_asset,
                                                                 const veiling::protocol::address& prize_asset,
                                                                 const veiling::protocol::amount& starting_price,
                                                                 const veiling::protocol::amount& minimum_price,
                                                                 const veiling::protocol::amount& decay_rate ) const
{
  return make_call_operation( id,
                              make_stdin( auction_instruction::initialize,
                                          admin,
                                          payment_asset,
                                          prize_asset,
                                          starting_price,
                                          minimum_price,
                                          decay_rate ) );
}

veiling::protocol::operation fixture::make_buy_operation( const veiling::protocol::account& id,
                                                          const veiling::protocol::account& buyer ) const
{
  return make_call_operation( id, make_stdin( auction_instruction::buy, buyer ) );
}

bool fixture::advance( std::uint64_t timestamp )
{
  return verify( _controller->process( make_block( timestamp ) ), verification::processed | verification::head );
}

void fixture::append_stdin( std::vector< std::byte >& input, const veiling::protocol::amount& a ) const
{
  auto bytes = veiling::protocol::encode_amount( a );
  if( !bytes )
    throw std::invalid_argument( "amount cannot be encoded: " + bytes.error().message() );

  input.insert( input.end(), bytes->begin(), bytes->end() );
}

veiling::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                      std::vector< std::string >&& arguments ) const noexcept
{
  veiling::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

veiling::controller::result< veiling::protocol::amount >
fixture::read_amount( const veiling::protocol::account& id, std::vector< std::byte >&& stdin ) const
{
  auto response = _controller->read_program( id, make_input( std::move( stdin ) ) );
  if( !response )
    return std::unexpected( response.error() );

  return veiling::protocol::decode_amount( response->stdout );
}

veiling::controller::result< veiling::protocol::amount > fixture::balance_of( const veiling::protocol::account& token,
                                                                              const veiling::protocol::account& owner ) const
{
  return read_amount( token, make_stdin( token_instruction::balance_of, owner ) );
}

bool fixture::verify( veiling::controller::result< veiling::protocol::block_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( veiling::log::instance(), "Block submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::head )
  {
    auto head = _controller->head();
    if( receipt->height != head.height )
    {
      LOG_ERROR( veiling::log::instance(), "Block height {} does not match head {}", receipt->height, head.height );
      return false;
    }
  }

  if( flags & verification::without_reversion )
  {
    for( const auto& tx_receipt: receipt->transaction_receipts )
    {
      if( tx_receipt.reverted )
      {
        LOG_ERROR( veiling::log::instance(),
                   "Transaction from {} with nonce {} was reverted",
                   veiling::log::hex{ tx_receipt.payer.data(), tx_receipt.payer.size() },
                   tx_receipt.nonce );
        return false;
      }
    }
  }

  return true;
}

bool fixture::verify( veiling::controller::result< veiling::protocol::transaction_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( veiling::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( veiling::log::instance(),
                 "Transaction from {} with nonce {} was reverted",
                 veiling::log::hex{ receipt->payer.data(), receipt->payer.size() },
                 receipt->nonce );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND

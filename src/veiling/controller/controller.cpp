#include <veiling/controller/controller.hpp>
#include <veiling/controller/execution_context.hpp>
#include <veiling/controller/state.hpp>

#include <veiling/log.hpp>

#include <memory>
#include <stdexcept>
#include <utility>

namespace veiling::controller {

controller::controller():
    _root( std::make_shared< state_db::state_node >() )
{}

controller::~controller() = default;

void controller::register_program( const protocol::account& account, std::shared_ptr< program::program > program )
{
  if( !account.program() )
    throw std::invalid_argument( "programs must be registered under a program account" );

  if( !program )
    throw std::invalid_argument( "program does not exist" );

  if( !_programs.emplace( account, program ).second )
    throw std::invalid_argument( "program account is already registered" );

  LOG_DEBUG( veiling::log::instance(),
             "Registered program - Name: {}, ID: {}",
             program->name(),
             veiling::log::hex{ account.data(), account.size() } );
}

result< protocol::block_receipt > controller::process( const protocol::block& block )
{
  if( !block.validate() )
    return std::unexpected( controller_errc::malformed_block );

  auto parent_info = head();

  if( block.height != parent_info.height + 1 )
    return std::unexpected( controller_errc::unexpected_height );

  if( block.timestamp < parent_info.time )
    return std::unexpected( controller_errc::timestamp_out_of_bounds );

  LOG_DEBUG( veiling::log::instance(),
             "Pushing block - Height: {}, Time: {}",
             block.height,
             veiling::log::ledger_time{ block.timestamp } );

  auto block_node = _root->make_child();

  execution_context context( _programs, intent::block_application );
  context.set_state_node( block_node );

  return context.apply( block ).and_then(
    [ & ]( auto&& receipt ) -> result< protocol::block_receipt >
    {
      block_node->squash();

      LOG_INFO( veiling::log::instance(),
                "Block applied - Height: {}, Time: {} [{} transaction(s)]",
                block.height,
                veiling::log::ledger_time{ block.timestamp },
                block.transactions.size() );

      return receipt;
    } );
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  if( !transaction.validate() )
    return std::unexpected( controller_errc::malformed_transaction );

  LOG_DEBUG( veiling::log::instance(),
             "Pushing transaction - Payer: {}, Nonce: {}",
             veiling::log::hex{ transaction.payer.data(), transaction.payer.size() },
             transaction.nonce );

  auto transaction_node = _root->make_child();

  execution_context context( _programs, intent::transaction_application );
  context.set_state_node( transaction_node );
  context.set_time( head().time );

  return context.apply( transaction )
    .and_then(
      [ & ]( auto&& receipt ) -> result< protocol::transaction_receipt >
      {
        if( receipt.reverted )
        {
          LOG_DEBUG( veiling::log::instance(), "Transaction reverted: {}", receipt.error.message() );
          return std::unexpected( receipt.error );
        }

        transaction_node->squash();

        LOG_DEBUG( veiling::log::instance(),
                   "Transaction applied - Payer: {}, Nonce: {}",
                   veiling::log::hex{ transaction.payer.data(), transaction.payer.size() },
                   transaction.nonce );

        return receipt;
      } );
}

state::head controller::head() const
{
  execution_context context( _programs );
  context.set_state_node( _root );
  return context.head();
}

result< protocol::program_output > controller::read_program( const protocol::account& account,
                                                             const protocol::program_input& input ) const
{
  execution_context context( _programs );
  context.set_state_node( _root->make_child() );
  context.set_time( head().time );

  auto frame = context.run_program( account, input.stdin, input.arguments );
  if( !frame )
    return std::unexpected( frame.error() );

  return protocol::program_output{ .code   = frame.value()->code,
                                   .stdout = std::move( frame.value()->stdout ),
                                   .stderr = std::move( frame.value()->stderr ) };
}

std::uint64_t controller::account_nonce( const protocol::account& account ) const
{
  execution_context context( _programs );
  context.set_state_node( _root );
  return context.account_nonce( account );
}

} // namespace veiling::controller

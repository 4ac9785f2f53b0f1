#include <array>
#include <algorithm>
#include <expected>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/endian.hpp>

#include <veiling/controller/execution_context.hpp>
#include <veiling/controller/state.hpp>
#include <veiling/memory.hpp>

namespace veiling::controller {

execution_context::execution_context( const program_registry& registry, intent i ):
    _registry( registry ),
    _intent( i )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::set_time( std::uint64_t time ) noexcept
{
  _time = time;
}

result< protocol::block_receipt > execution_context::apply( const protocol::block& block )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  set_head( { .height = block.height, .time = block.timestamp } );
  _time = block.timestamp;

  protocol::block_receipt receipt;
  receipt.height    = block.height;
  receipt.timestamp = block.timestamp;

  for( const auto& transaction: block.transactions )
  {
    auto transaction_receipt = apply( transaction );
    if( !transaction_receipt )
      return std::unexpected( transaction_receipt.error() );

    receipt.transaction_receipts.emplace_back( std::move( *transaction_receipt ) );
  }

  return receipt;
}

result< protocol::transaction_receipt > execution_context::apply( const protocol::transaction& transaction )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _transaction = &transaction;
  _frames.clear();

  if( auto authorized = check_authority( transaction.payer ); authorized )
  {
    if( !authorized.value() )
      return std::unexpected( controller_errc::authorization_failure );
  }
  else
  {
    return std::unexpected( authorized.error() );
  }

  if( account_nonce( transaction.payer ) + 1 != transaction.nonce )
    return std::unexpected( controller_errc::invalid_nonce );

  set_account_nonce( transaction.payer, transaction.nonce );

  auto block_node = _state_node;

  auto error = [ & ]() -> std::error_code
  {
    auto transaction_node = block_node->make_child();
    _state_node           = transaction_node;

    for( const auto& o: transaction.operations )
      if( auto error = apply( o ); error )
        return error;

    transaction_node->squash();
    return controller_errc::ok;
  }();

  _state_node = block_node;

  protocol::transaction_receipt receipt;
  receipt.payer  = transaction.payer;
  receipt.nonce  = transaction.nonce;
  receipt.frames = std::move( _frames );

  if( error )
  {
    receipt.reverted = true;
    receipt.error    = error;
    receipt.logs.push_back( "transaction reverted: " + error.message() );
  }

  _transaction = nullptr;

  return receipt;
}

std::error_code execution_context::apply( const protocol::call_program& op )
{
  auto frame = run_program( op.id, op.input.stdin, op.input.arguments );

  if( !frame )
    return frame.error();

  return controller_errc::ok;
}

std::uint64_t execution_context::account_nonce( protocol::account_view account ) const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto nonce_bytes = _state_node->get( state::space::transaction_nonce(), account ); nonce_bytes )
  {
    auto nonce = memory::bit_cast< std::uint64_t >( *nonce_bytes );
    boost::endian::little_to_native_inplace( nonce );
    return nonce;
  }

  return 0;
}

void execution_context::set_account_nonce( protocol::account_view account, std::uint64_t nonce )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  boost::endian::native_to_little_inplace( nonce );
  _state_node->put( state::space::transaction_nonce(), account, memory::as_bytes( nonce ) );
}

state::head execution_context::head() const
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  state::head head;

  if( auto head_bytes = _state_node->get( state::space::metadata(), state::key::head_key() ); head_bytes )
  {
    head.height = memory::bit_cast< std::uint64_t >( *head_bytes );
    head.time   = memory::bit_cast< std::uint64_t >( head_bytes->subspan( sizeof( std::uint64_t ) ) );
    boost::endian::little_to_native_inplace( head.height );
    boost::endian::little_to_native_inplace( head.time );
  }

  return head;
}

void execution_context::set_head( const state::head& head )
{
  std::array< std::uint64_t, 2 > fields{ boost::endian::native_to_little( head.height ),
                                         boost::endian::native_to_little( head.time ) };

  _state_node->put( state::space::metadata(), state::key::head_key(), memory::as_bytes( fields ) );
}

std::span< const std::string > execution_context::arguments()
{
  return _stack.peek_frame().arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd == program::file_descriptor::stdout )
  {
    auto& output = _stack.peek_frame().stdout;
    output.insert( output.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    auto& error = _stack.peek_frame().stderr;
    error.insert( error.end(), buffer.begin(), buffer.end() );
    return reversion_errc::ok;
  }

  return reversion_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  auto& frame = _stack.peek_frame();

  if( frame.stdin.size() - frame.stdin_offset < buffer.size() )
    return reversion_errc::insufficient_input;

  std::ranges::copy( frame.stdin.subspan( frame.stdin_offset, buffer.size() ), buffer.begin() );
  frame.stdin_offset += buffer.size();
  return reversion_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id )
{
  state_db::object_space space{ .system = false, .id = id };
  std::ranges::copy( _stack.peek_frame().program_id, space.account.begin() );

  return space;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

result< bool > execution_context::check_authority( protocol::account_view account )
{
  if( _intent == intent::read_only )
    return std::unexpected( reversion_errc::read_only_context );

  // Programs act through being the caller, never through authorizations
  if( !account.user() )
    return false;

  if( _transaction == nullptr )
    throw std::runtime_error( "transaction required for check authority" );

  return std::ranges::any_of( _transaction->authorizations,
                              [ & ]( const protocol::account& signer )
                              {
                                return std::ranges::equal( signer, account );
                              } );
}

std::span< const std::byte > execution_context::get_caller()
{
  if( _stack.size() < 2 )
    return std::span< const std::byte >{};

  return _stack.peek_frame( 1 ).program_id;
}

protocol::account_view execution_context::get_self()
{
  const auto& id = _stack.peek_frame().program_id;
  return protocol::account_view( id.data(), id.size() );
}

std::uint64_t execution_context::get_time()
{
  return _time;
}

result< protocol::program_output > execution_context::call_program( protocol::account_view account,
                                                                    std::span< const std::byte > stdin,
                                                                    std::span< const std::string > arguments )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( !account.program() )
    return std::unexpected( reversion_errc::invalid_program );

  auto registry_iterator = _registry.find( account );
  if( registry_iterator == _registry.end() )
    return std::unexpected( reversion_errc::invalid_program );

  if( auto error = _stack.push_frame( { .program_id = account, .arguments = arguments, .stdin = stdin } ); error )
    return std::unexpected( error );

  frame_guard guard( _stack );

  if( auto error = registry_iterator->second->run( this, arguments ); error )
    return std::unexpected( error );

  auto& frame = _stack.peek_frame();
  return protocol::program_output{ .stdout = std::move( frame.stdout ), .stderr = std::move( frame.stderr ) };
}

result< std::shared_ptr< protocol::program_frame > > execution_context::run_program(
  protocol::account_view account,
  std::span< const std::byte > stdin,
  std::span< const std::string > arguments )
{
  auto depth  = static_cast< std::uint32_t >( _stack.size() + 1 );
  auto output = call_program( account, stdin, arguments );
  if( !output )
    return std::unexpected( output.error() );

  auto frame = std::make_shared< protocol::program_frame >();
  std::ranges::copy( account, frame->id.begin() );
  frame->depth     = depth;
  frame->arguments = std::vector( arguments.begin(), arguments.end() );
  frame->stdin     = std::vector( stdin.begin(), stdin.end() );
  frame->stdout    = std::move( output->stdout );
  frame->stderr    = std::move( output->stderr );

  _frames.push_back( frame );
  return frame;
}

} // namespace veiling::controller

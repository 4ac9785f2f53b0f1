#include <veiling/auction/token_client.hpp>
#include <veiling/program/io.hpp>
#include <veiling/program/token.hpp>

#include <algorithm>

namespace veiling::auction {

using instruction = program::token::instruction;

token_client::token_client( program::system_interface* system, const protocol::address& asset ) noexcept:
    _system( system ),
    _id( protocol::program_account( asset ) )
{}

result< protocol::amount > token_client::balance_of( const protocol::account& account )
{
  program::input_buffer input;
  input.append( instruction::balance_of ).append( account );

  auto output = _system->call_program( _id, input.bytes() );
  if( !output )
    return std::unexpected( output.error() );

  auto balance = protocol::decode_amount( output->stdout );
  if( !balance )
    return std::unexpected( program_errc::unexpected_object );

  return balance;
}

std::error_code
token_client::transfer( const protocol::account& from, const protocol::account& to, const protocol::amount& value )
{
  program::input_buffer input;
  input.append( instruction::transfer ).append( from ).append( to ).append( value );

  if( auto output = _system->call_program( _id, input.bytes() ); !output )
    return output.error();

  return program_errc::ok;
}

std::error_code
token_client::transfer_from( const protocol::account& from, const protocol::account& to, const protocol::amount& value )
{
  protocol::account self;
  std::ranges::copy( _system->get_self(), self.begin() );

  program::input_buffer input;
  input.append( instruction::transfer_from ).append( self ).append( from ).append( to ).append( value );

  if( auto output = _system->call_program( _id, input.bytes() ); !output )
    return output.error();

  return program_errc::ok;
}

} // namespace veiling::auction

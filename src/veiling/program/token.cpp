#include <algorithm>
#include <utility>

#include <veiling/memory.hpp>
#include <veiling/program/io.hpp>
#include <veiling/program/token.hpp>

namespace veiling::program {

static constexpr std::uint32_t supply_id    = 0;
static constexpr std::uint32_t balance_id   = 1;
static constexpr std::uint32_t allowance_id = 2;

static result< protocol::amount >
get_amount( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto object = system->get_object( id, key );
  if( !object.size() )
    return protocol::amount( 0 );

  auto value = protocol::decode_amount( object );
  if( !value )
    return std::unexpected( program_errc::unexpected_object );

  return value;
}

// Zero amounts are not stored, a missing object reads back as zero.
static std::error_code
put_amount( system_interface* system, std::uint32_t id, std::span< const std::byte > key, const protocol::amount& value )
{
  if( value.is_zero() )
    return system->remove_object( id, key );

  auto bytes = protocol::encode_amount( value );
  if( !bytes )
    return program_errc::invalid_argument;

  return system->put_object( id, key, *bytes );
}

static result< bool > has_authority( system_interface* system, const protocol::account& account )
{
  if( std::ranges::equal( account, system->get_caller() ) )
    return true;

  return system->check_authority( account );
}

token::token( token_metadata metadata ):
    _metadata( std::move( metadata ) )
{}

result< protocol::amount > token::total_supply( system_interface* system )
{
  return get_amount( system, supply_id, std::span< const std::byte >{} );
}

result< protocol::amount > token::balance_of( system_interface* system, const protocol::account& account )
{
  return get_amount( system, balance_id, account );
}

result< protocol::amount >
token::allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender )
{
  return get_amount( system, allowance_id, memory::concat( owner, spender ) );
}

std::error_code token::move_balance( system_interface* system,
                                     const protocol::account& from,
                                     const protocol::account& to,
                                     const protocol::amount& value )
{
  if( from == to )
    return program_errc::invalid_argument;

  auto from_balance = balance_of( system, from );
  if( !from_balance )
    return from_balance.error();

  if( *from_balance < value )
    return program_errc::insufficient_balance;

  auto to_balance = balance_of( system, to );
  if( !to_balance )
    return to_balance.error();

  if( auto error = put_amount( system, balance_id, from, *from_balance - value ); error )
    return error;

  return put_amount( system, balance_id, to, *to_balance + value );
}

std::string_view token::name() const noexcept
{
  return _metadata.symbol;
}

std::error_code token::run( system_interface* system, const std::span< const std::string > arguments )
{
  std::uint32_t instruction = 0;
  if( auto error = read( system, instruction ); error )
    return error;

  switch( instruction )
  {
    case std::to_underlying( instruction::name ):
      return system->write( file_descriptor::stdout, memory::as_bytes( _metadata.name ) );
    case std::to_underlying( instruction::symbol ):
      return system->write( file_descriptor::stdout, memory::as_bytes( _metadata.symbol ) );
    case std::to_underlying( instruction::decimals ):
      return write( system, _metadata.decimals );
    case std::to_underlying( instruction::total_supply ):
      {
        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        return write( system, *supply );
      }
    case std::to_underlying( instruction::balance_of ):
      {
        protocol::account account;
        if( auto error = read( system, account ); error )
          return error;

        auto balance = balance_of( system, account );
        if( !balance )
          return balance.error();

        return write( system, *balance );
      }
    case std::to_underlying( instruction::transfer ):
      {
        protocol::account from;
        protocol::account to;
        protocol::amount value;

        if( auto error = read( system, from, to, value ); error )
          return error;

        auto authorized = has_authority( system, from );
        if( !authorized )
          return authorized.error();

        if( !*authorized )
          return program_errc::unauthorized;

        return move_balance( system, from, to, value );
      }
    case std::to_underlying( instruction::mint ):
      {
        protocol::account to;
        protocol::amount value;

        if( auto error = read( system, to, value ); error )
          return error;

        auto authorized = has_authority( system, _metadata.minter );
        if( !authorized )
          return authorized.error();

        if( !*authorized )
          return program_errc::unauthorized;

        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        auto to_balance = balance_of( system, to );
        if( !to_balance )
          return to_balance.error();

        if( auto error = put_amount( system, supply_id, std::span< const std::byte >{}, *supply + value ); error )
          return error;

        return put_amount( system, balance_id, to, *to_balance + value );
      }
    case std::to_underlying( instruction::burn ):
      {
        protocol::account from;
        protocol::amount value;

        if( auto error = read( system, from, value ); error )
          return error;

        auto authorized = has_authority( system, from );
        if( !authorized )
          return authorized.error();

        if( !*authorized )
          return program_errc::unauthorized;

        auto from_balance = balance_of( system, from );
        if( !from_balance )
          return from_balance.error();

        if( *from_balance < value )
          return program_errc::insufficient_balance;

        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        if( auto error = put_amount( system, supply_id, std::span< const std::byte >{}, *supply - value ); error )
          return error;

        return put_amount( system, balance_id, from, *from_balance - value );
      }
    case std::to_underlying( instruction::approve ):
      {
        protocol::account owner;
        protocol::account spender;
        protocol::amount value;

        if( auto error = read( system, owner, spender, value ); error )
          return error;

        auto authorized = has_authority( system, owner );
        if( !authorized )
          return authorized.error();

        if( !*authorized )
          return program_errc::unauthorized;

        return put_amount( system, allowance_id, memory::concat( owner, spender ), value );
      }
    case std::to_underlying( instruction::allowance ):
      {
        protocol::account owner;
        protocol::account spender;

        if( auto error = read( system, owner, spender ); error )
          return error;

        auto approved = allowance( system, owner, spender );
        if( !approved )
          return approved.error();

        return write( system, *approved );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        protocol::account spender;
        protocol::account from;
        protocol::account to;
        protocol::amount value;

        if( auto error = read( system, spender, from, to, value ); error )
          return error;

        auto authorized = has_authority( system, spender );
        if( !authorized )
          return authorized.error();

        if( !*authorized )
          return program_errc::unauthorized;

        auto approved = allowance( system, from, spender );
        if( !approved )
          return approved.error();

        if( *approved < value )
          return program_errc::insufficient_allowance;

        if( auto error = move_balance( system, from, to, value ); error )
          return error;

        return put_amount( system, allowance_id, memory::concat( from, spender ), *approved - value );
      }
    default:
      return program_errc::invalid_instruction;
  }

  std::unreachable();
}

} // namespace veiling::program

#pragma once

#include <veiling/auction/error.hpp>
#include <veiling/program/system_interface.hpp>
#include <veiling/protocol.hpp>

namespace veiling::auction {

/**
 * Calls into the token program registered under an asset address on behalf
 * of the running program.
 */
class token_client final
{
public:
  token_client( program::system_interface* system, const protocol::address& asset ) noexcept;

  result< protocol::amount > balance_of( const protocol::account& account );

  std::error_code transfer( const protocol::account& from, const protocol::account& to, const protocol::amount& value );

  /**
   * Spends an allowance granted by from to the running program.
   */
  std::error_code
  transfer_from( const protocol::account& from, const protocol::account& to, const protocol::amount& value );

private:
  program::system_interface* _system;
  protocol::account _id;
};

} // namespace veiling::auction

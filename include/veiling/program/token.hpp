#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <veiling/program/error.hpp>
#include <veiling/program/program.hpp>
#include <veiling/protocol.hpp>

namespace veiling::program {

struct token_metadata
{
  std::string name;
  std::string symbol;
  std::uint32_t decimals = 0;
  protocol::account minter{};
};

/**
 * A fungible token. Each registered instance keeps its balances in the object
 * space of the account it is registered under.
 */
struct token final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    transfer,
    mint,
    burn,
    approve,
    allowance,
    transfer_from
  };

  token( token_metadata metadata );
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::string_view name() const noexcept override;
  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

private:
  result< protocol::amount > total_supply( system_interface* system );
  result< protocol::amount > balance_of( system_interface* system, const protocol::account& account );
  result< protocol::amount >
  allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender );

  std::error_code move_balance( system_interface* system,
                                const protocol::account& from,
                                const protocol::account& to,
                                const protocol::amount& value );

  token_metadata _metadata;
};

} // namespace veiling::program

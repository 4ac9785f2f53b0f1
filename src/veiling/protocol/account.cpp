#include <veiling/protocol/account.hpp>

#include <algorithm>
#include <utility>

namespace veiling::protocol {

constexpr auto user_account_prefix    = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix = std::byte{ std::to_underlying( account_type::program ) };

bool account::user() const noexcept
{
  return front() == user_account_prefix;
}

bool account::program() const noexcept
{
  return front() == program_account_prefix;
}

account_view::account_view( const account& acc ) noexcept:
    std::span< const std::byte, address_length + 1 >( acc )
{}

account_view::account_view( const std::byte* ptr, std::size_t length ) noexcept:
    std::span< const std::byte, address_length + 1 >( ptr, length )
{}

bool account_view::user() const noexcept
{
  return front() == user_account_prefix;
}

bool account_view::program() const noexcept
{
  return front() == program_account_prefix;
}

account user_account( const address& addr ) noexcept
{
  account a{ user_account_prefix };
  std::ranges::copy( addr, a.begin() + 1 );
  return a;
}

account program_account( const address& addr ) noexcept
{
  account a{ program_account_prefix };
  std::ranges::copy( addr, a.begin() + 1 );
  return a;
}

address make_address( std::string_view name ) noexcept
{
  address a{};

  std::size_t length = std::min( name.length(), a.size() );
  for( std::size_t i = 0; i < length; ++i )
    a.at( i ) = static_cast< std::byte >( name[ i ] );

  return a;
}

account user_account( std::string_view name ) noexcept
{
  return user_account( make_address( name ) );
}

account program_account( std::string_view name ) noexcept
{
  return program_account( make_address( name ) );
}

} // namespace veiling::protocol

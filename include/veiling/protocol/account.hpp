#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace veiling::protocol {

constexpr std::size_t address_length = 32;

/**
 * A 32 byte handle. Asset ids are addresses of token programs.
 */
using address = std::array< std::byte, address_length >;

enum class account_type : std::uint8_t
{
  invalid = 0x00,
  user    = 0x01,
  program = 0x02
};

/**
 * An identity: one type byte followed by an address. Users hold authority
 * through transaction authorizations, programs through being the caller.
 */
struct account: std::array< std::byte, address_length + 1 >
{
  bool user() const noexcept;
  bool program() const noexcept;
};

struct account_view: std::span< const std::byte, address_length + 1 >
{
  account_view( const account& ) noexcept;
  account_view( const std::byte*, std::size_t ) noexcept;

  bool user() const noexcept;
  bool program() const noexcept;
};

account user_account( const address& ) noexcept;
account program_account( const address& ) noexcept;

/**
 * Builds an address from up to 32 characters of a name, zero padded.
 */
address make_address( std::string_view name ) noexcept;

account user_account( std::string_view name ) noexcept;
account program_account( std::string_view name ) noexcept;

} // namespace veiling::protocol

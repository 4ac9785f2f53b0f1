#pragma once

#include <cstdint>

#include <veiling/auction/error.hpp>
#include <veiling/program/system_interface.hpp>
#include <veiling/protocol.hpp>

namespace veiling::auction {

/**
 * Object ids of the auction's persisted state. Every key but nonce holds a
 * single object under an empty key; nonces are keyed by account.
 */
enum class key : std::uint32_t // NOLINT(performance-enum-size)
{
  admin,
  payment_asset,
  prize_asset,
  starting_price,
  minimum_price,
  start_time,
  decay_rate,
  nonce
};

/**
 * Typed access to the object space of the running auction program.
 *
 * Prices and nonces read as zero when absent. The remaining fields only exist
 * once the auction is initialized and fail with program_errc::uninitialized
 * otherwise.
 */
class store final
{
public:
  explicit store( program::system_interface* system ) noexcept;

  bool has_admin() const;

  result< protocol::account > admin() const;
  result< protocol::address > payment_asset() const;
  result< protocol::address > prize_asset() const;
  result< protocol::amount > starting_price() const;
  result< protocol::amount > minimum_price() const;
  result< std::uint64_t > start_time() const;
  result< protocol::amount > decay_rate() const;
  result< protocol::amount > nonce( const protocol::account& account ) const;

  std::error_code put_admin( const protocol::account& account );
  std::error_code put_payment_asset( const protocol::address& asset );
  std::error_code put_prize_asset( const protocol::address& asset );
  std::error_code put_starting_price( const protocol::amount& price );
  std::error_code put_minimum_price( const protocol::amount& price );
  std::error_code put_start_time( std::uint64_t time );
  std::error_code put_decay_rate( const protocol::amount& rate );

private:
  result< protocol::amount > get_amount( key k, bool required ) const;
  result< protocol::address > get_address( key k ) const;
  std::error_code put_amount( key k, const protocol::amount& value );

  program::system_interface* _system;
};

} // namespace veiling::auction

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <veiling/program/error.hpp>
#include <veiling/program/program.hpp>

namespace veiling::program {

/**
 * A single lot Dutch auction. The prize is whatever balance of the prize
 * asset the auction account holds when a buyer settles.
 */
struct dutch_auction final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    initialize,
    nonce,
    buy,
    get_price
  };

  dutch_auction()                       = default;
  dutch_auction( const dutch_auction& ) = delete;
  dutch_auction( dutch_auction&& )      = delete;
  ~dutch_auction() override             = default;

  dutch_auction& operator=( const dutch_auction& ) = delete;
  dutch_auction& operator=( dutch_auction&& )      = delete;

  std::string_view name() const noexcept override;
  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;
};

} // namespace veiling::program

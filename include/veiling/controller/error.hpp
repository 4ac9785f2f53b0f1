#pragma once

#include <expected>
#include <system_error>

namespace veiling::controller {

/**
 * Failures of a running program that revert the enclosing transaction.
 */
enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_program,
  read_only_context,
  stack_overflow,
  bad_file_descriptor,
  insufficient_input
};

/**
 * Failures that reject a transaction or block before it is applied.
 */
enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  authorization_failure,
  invalid_nonce,
  malformed_block,
  malformed_transaction,
  unexpected_height,
  timestamp_out_of_bounds
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace veiling::controller

template<>
struct std::is_error_code_enum< veiling::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< veiling::controller::controller_errc >: public std::true_type
{};

#pragma once

#include <expected>
#include <system_error>

#include <veiling/program/error.hpp>

namespace veiling::auction {

using program::program_errc;

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace veiling::auction

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <veiling/protocol/error.hpp>

namespace veiling::protocol {

/**
 * Arbitrary precision signed integer used for prices, balances and nonces.
 */
using amount = boost::multiprecision::cpp_int;

constexpr std::size_t max_amount_size = 256;

/**
 * Encodes a non-negative amount as a little endian u32 byte count followed by
 * the little endian magnitude. Zero has an empty magnitude.
 */
result< std::vector< std::byte > > encode_amount( const amount& a );

/**
 * Decodes exactly one encoded amount occupying the whole buffer.
 */
result< amount > decode_amount( std::span< const std::byte > bytes );

/**
 * Decodes a bare little endian magnitude.
 */
amount decode_magnitude( std::span< const std::byte > bytes );

} // namespace veiling::protocol

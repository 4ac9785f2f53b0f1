#pragma once

#include <span>
#include <string>

namespace veiling::encode {

/**
 * Lower case hex with a leading "0x".
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

} // namespace veiling::encode

#include <veiling/encode/hex.hpp>

#include <cstdint>
#include <string_view>

namespace veiling::encode {

static constexpr std::string_view hex_digits = "0123456789abcdef";
static constexpr std::string_view hex_prefix = "0x";

std::string to_hex( std::span< const std::byte > s ) noexcept
{
  std::string str;
  str.reserve( hex_prefix.size() + s.size() * 2 );
  str.append( hex_prefix );

  for( auto b: s )
  {
    auto value = std::to_integer< std::uint8_t >( b );
    str.push_back( hex_digits[ value >> 4 ] );
    str.push_back( hex_digits[ value & 0x0f ] );
  }

  return str;
}

} // namespace veiling::encode

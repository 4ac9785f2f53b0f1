#include <veiling/protocol/error.hpp>

#include <string>
#include <utility>

namespace veiling::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::truncated_amount:
        return "truncated amount"s;
      case protocol_errc::amount_too_large:
        return "amount too large"s;
      case protocol_errc::negative_amount:
        return "negative amount"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace veiling::protocol

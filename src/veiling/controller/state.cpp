#include <veiling/controller/state.hpp>
#include <veiling/memory.hpp>

#include <string_view>
#include <utility>

namespace veiling::controller::state {
namespace space {

enum class system_space_id : std::uint8_t
{
  metadata          = 0,
  transaction_nonce = 1
};

const state_db::object_space& metadata()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::metadata ) };
  return s;
}

const state_db::object_space& transaction_nonce()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::transaction_nonce ) };
  return s;
}

} // namespace space

namespace key {

std::span< const std::byte > head_key()
{
  static constexpr std::string_view k = "object_key::head";
  return memory::as_bytes( k );
}

} // namespace key
} // namespace veiling::controller::state

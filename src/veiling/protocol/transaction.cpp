#include <veiling/protocol/block.hpp>
#include <veiling/protocol/transaction.hpp>

#include <algorithm>

namespace veiling::protocol {

bool call_program::validate() const noexcept
{
  return id.program();
}

bool transaction::validate() const noexcept
{
  if( !payer.user() && !payer.program() )
    return false;

  if( operations.empty() )
    return false;

  return std::ranges::all_of( operations,
                              []( const auto& op )
                              {
                                return op.validate();
                              } );
}

bool block::validate() const noexcept
{
  return std::ranges::all_of( transactions,
                              []( const auto& t )
                              {
                                return t.validate();
                              } );
}

} // namespace veiling::protocol

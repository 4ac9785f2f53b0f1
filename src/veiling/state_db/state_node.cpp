#include <veiling/state_db/state_node.hpp>

#include <algorithm>
#include <iterator>

#include <boost/endian.hpp>

#include <veiling/memory.hpp>

namespace veiling::state_db {

std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  auto id = boost::endian::native_to_big( space.id );

  std::vector< std::byte > compound_key;
  compound_key.reserve( 1 + space.account.size() + sizeof( id ) + key.size() );
  compound_key.push_back( space.system ? std::byte{ 0x01 } : std::byte{ 0x00 } );
  std::ranges::copy( space.account, std::back_inserter( compound_key ) );
  std::ranges::copy( memory::as_bytes( id ), std::back_inserter( compound_key ) );
  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

state_node::state_node():
    _delta( std::make_shared< state_delta >() )
{}

state_node::state_node( const state_delta_ptr& delta ) noexcept:
    _delta( delta )
{}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return _delta->get( make_compound_key( space, key ) );
}

void state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  _delta->remove( make_compound_key( space, key ) );
}

state_node_ptr state_node::make_child()
{
  return std::make_shared< state_node >( _delta->make_child() );
}

void state_node::squash()
{
  _delta->squash();
}

} // namespace veiling::state_db

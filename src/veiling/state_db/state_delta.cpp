#include <veiling/state_db/state_delta.hpp>

namespace veiling::state_db {

state_delta::state_delta( const state_delta_ptr& parent ) noexcept:
    _parent( parent )
{}

void state_delta::remove( std::vector< std::byte >&& key )
{
  if( !get( key ) )
    return;

  _objects.erase( key );

  if( !root() )
    _removed_objects.emplace( std::move( key ) );
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node != nullptr; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto itr = node->_objects.find( key ); itr != node->_objects.end() )
      return std::span< const std::byte >( itr->second );
  }

  return {};
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a state delta with no parent" );

  auto& parent = *_parent;

  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    parent._objects.erase( *itr );

    if( !parent.root() )
      parent._removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  for( auto itr = _objects.begin(); itr != _objects.end(); itr = _objects.begin() )
  {
    auto node = _objects.extract( itr );
    parent._removed_objects.erase( node.key() );
    parent._objects.insert_or_assign( std::move( node.key() ), std::move( node.mapped() ) );
  }
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

state_delta_ptr state_delta::make_child()
{
  return std::make_shared< state_delta >( shared_from_this() );
}

} // namespace veiling::state_db

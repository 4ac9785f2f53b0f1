#pragma once

#include <veiling/state_db/types.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <vector>

namespace veiling::state_db {

/**
 * A layer of writes over an optional parent. Reads fall through to the parent
 * unless the key was written or removed in this layer.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  state_delta_ptr _parent;
  std::map< std::vector< std::byte >, std::vector< std::byte > > _objects;
  std::set< std::vector< std::byte > > _removed_objects;

public:
  state_delta() noexcept = default;
  state_delta( const state_delta_ptr& parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  void put( std::vector< std::byte >&& key, const ValueType& value );
  void remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Merges this delta into its parent. The delta is left empty.
   */
  void squash();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;

  state_delta_ptr make_child();
};

template< std::ranges::range ValueType >
void state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  _removed_objects.erase( key );
  _objects.insert_or_assign( std::move( key ), std::vector< std::byte >( value.begin(), value.end() ) );
}

} // namespace veiling::state_db

#pragma once

#include <veiling/state_db/state_delta.hpp>
#include <veiling/state_db/types.hpp>

#include <optional>
#include <ranges>
#include <span>
#include <vector>

namespace veiling::state_db {

std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key );

/**
 * A view of state addressed by object space and key. Children collect the
 * writes of a single unit of work; squashing a child publishes them to its
 * parent, dropping the child discards them.
 */
class state_node final
{
public:
  state_node();
  explicit state_node( const state_delta_ptr& delta ) noexcept;
  state_node( const state_node& node ) = delete;
  state_node( state_node&& node )      = delete;
  ~state_node()                        = default;

  state_node& operator=( const state_node& node ) = delete;
  state_node& operator=( state_node&& node )      = delete;

  /**
   * Fetch an object if one exists.
   */
  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;

  /**
   * Write an object into the state_node.
   */
  template< std::ranges::range ValueType >
  void put( const object_space& space, std::span< const std::byte > key, const ValueType& value )
  {
    _delta->put( make_compound_key( space, key ), value );
  }

  /**
   * Remove an object from the state_node
   */
  void remove( const object_space& space, std::span< const std::byte > key );

  /**
   * Returns a child state node with this node as its parent.
   */
  state_node_ptr make_child();

  /**
   * Squash the node in to the parent node.
   */
  void squash();

private:
  state_delta_ptr _delta;
};

} // namespace veiling::state_db

#pragma once

#include <veiling/controller/call_stack.hpp>
#include <veiling/controller/controller.hpp>
#include <veiling/controller/error.hpp>
#include <veiling/controller/state.hpp>
#include <veiling/program.hpp>
#include <veiling/protocol.hpp>
#include <veiling/state_db.hpp>

#include <memory>
#include <span>
#include <vector>

namespace veiling::controller {

enum class intent : std::uint8_t
{
  read_only,
  block_application,
  transaction_application
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const program_registry& registry, intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void set_time( std::uint64_t time ) noexcept;

  result< protocol::block_receipt > apply( const protocol::block& );
  result< protocol::transaction_receipt > apply( const protocol::transaction& );

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  result< bool > check_authority( protocol::account_view account ) final;

  std::span< const std::byte > get_caller() final;
  protocol::account_view get_self() final;
  std::uint64_t get_time() final;

  result< protocol::program_output > call_program( protocol::account_view account,
                                                   std::span< const std::byte > stdin,
                                                   std::span< const std::string > arguments = {} ) final;

  /**
   * Runs a program at the top of the call stack and records its frame.
   */
  result< std::shared_ptr< protocol::program_frame > > run_program( protocol::account_view account,
                                                                    std::span< const std::byte > stdin,
                                                                    std::span< const std::string > arguments = {} );

  std::uint64_t account_nonce( protocol::account_view ) const;
  state::head head() const;

private:
  std::error_code apply( const protocol::call_program& );
  void set_account_nonce( protocol::account_view account, std::uint64_t nonce );
  void set_head( const state::head& head );

  state_db::object_space create_object_space( std::uint32_t id );

  const program_registry& _registry;
  state_db::state_node_ptr _state_node;
  call_stack _stack;
  std::uint64_t _time = 0;

  const protocol::transaction* _transaction = nullptr;
  std::vector< std::shared_ptr< protocol::program_frame > > _frames;

  intent _intent;
};

} // namespace veiling::controller

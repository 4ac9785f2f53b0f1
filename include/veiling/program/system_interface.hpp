#pragma once

#include <veiling/program/error.hpp>
#include <veiling/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>

namespace veiling::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * The host services available to a running program. Objects are scoped to
 * the running program; an absent object reads as an empty span.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual result< bool > check_authority( protocol::account_view account ) = 0;

  /**
   * The program that called the running program, empty for a top level call.
   */
  virtual std::span< const std::byte > get_caller() = 0;

  /**
   * The account of the running program.
   */
  virtual protocol::account_view get_self() = 0;

  /**
   * Ledger time in seconds.
   */
  virtual std::uint64_t get_time() = 0;

  virtual result< protocol::program_output > call_program( protocol::account_view account,
                                                           std::span< const std::byte > stdin,
                                                           std::span< const std::string > arguments = {} ) = 0;
};

} // namespace veiling::program

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <veiling/program/system_interface.hpp>

namespace veiling::program {

/**
 * A native program hosted by the controller. Programs hold no ledger state of
 * their own, everything they persist goes through the system interface, so a
 * single instance may serve any number of calls.
 */
struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  // A short human readable label, used in logs
  virtual std::string_view name() const noexcept = 0;

  /**
   * Runs a single call. The instruction and its arguments are read from the
   * system's stdin, results are written to its stdout.
   */
  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace veiling::program

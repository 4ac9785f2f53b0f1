#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <veiling/memory.hpp>
#include <veiling/program/system_interface.hpp>
#include <veiling/protocol.hpp>

namespace veiling::program {

/**
 * Program arguments are read from stdin in order. Integers are little endian,
 * accounts and addresses are raw bytes, amounts use the amount encoding.
 */
template< std::integral T >
std::error_code read( system_interface* system, T& t )
{
  if( auto error = system->read( file_descriptor::stdin, memory::as_writable_bytes( t ) ); error )
    return error;

  boost::endian::little_to_native_inplace( t );
  return program_errc::ok;
}

std::error_code read( system_interface* system, protocol::account& a );
std::error_code read( system_interface* system, protocol::address& a );
std::error_code read( system_interface* system, protocol::amount& a );

template< typename... Args >
  requires( sizeof...( Args ) > 1 )
std::error_code read( system_interface* system, Args&... args )
{
  std::error_code error;
  ( ( error = error ? error : read( system, args ) ), ... );
  return error;
}

template< std::integral T >
std::error_code write( system_interface* system, T t )
{
  boost::endian::native_to_little_inplace( t );
  return system->write( file_descriptor::stdout, memory::as_bytes( t ) );
}

std::error_code write( system_interface* system, const protocol::amount& a );

/**
 * Builds the stdin of a program call.
 */
class input_buffer
{
public:
  template< std::integral T >
  input_buffer& append( T t )
  {
    boost::endian::native_to_little_inplace( t );
    auto bytes = memory::as_bytes( t );
    _buffer.insert( _buffer.end(), bytes.begin(), bytes.end() );
    return *this;
  }

  template< typename T >
    requires std::is_enum_v< T >
  input_buffer& append( T t )
  {
    return append( std::to_underlying( t ) );
  }

  input_buffer& append( const protocol::account& a );
  input_buffer& append( const protocol::address& a );
  input_buffer& append( const protocol::amount& a );

  std::span< const std::byte > bytes() const noexcept;

private:
  std::vector< std::byte > _buffer;
};

} // namespace veiling::program

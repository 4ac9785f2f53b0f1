#include <veiling/program/io.hpp>

#include <stdexcept>

namespace veiling::program {

std::error_code read( system_interface* system, protocol::account& a )
{
  return system->read( file_descriptor::stdin, memory::as_writable_bytes( a ) );
}

std::error_code read( system_interface* system, protocol::address& a )
{
  return system->read( file_descriptor::stdin, memory::as_writable_bytes( a ) );
}

std::error_code read( system_interface* system, protocol::amount& a )
{
  std::uint32_t length = 0;
  if( auto error = read( system, length ); error )
    return error;

  if( length > protocol::max_amount_size )
    return program_errc::invalid_argument;

  std::vector< std::byte > magnitude( length );
  if( auto error = system->read( file_descriptor::stdin, magnitude ); error )
    return error;

  a = protocol::decode_magnitude( magnitude );
  return program_errc::ok;
}

std::error_code write( system_interface* system, const protocol::amount& a )
{
  auto bytes = protocol::encode_amount( a );
  if( !bytes )
    return program_errc::invalid_argument;

  return system->write( file_descriptor::stdout, *bytes );
}

input_buffer& input_buffer::append( const protocol::account& a )
{
  _buffer.insert( _buffer.end(), a.begin(), a.end() );
  return *this;
}

input_buffer& input_buffer::append( const protocol::address& a )
{
  _buffer.insert( _buffer.end(), a.begin(), a.end() );
  return *this;
}

input_buffer& input_buffer::append( const protocol::amount& a )
{
  auto bytes = protocol::encode_amount( a );
  if( !bytes )
    throw std::invalid_argument( "cannot encode amount: " + bytes.error().message() );

  _buffer.insert( _buffer.end(), bytes->begin(), bytes->end() );
  return *this;
}

std::span< const std::byte > input_buffer::bytes() const noexcept
{
  return _buffer;
}

} // namespace veiling::program

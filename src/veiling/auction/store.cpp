#include <veiling/auction/store.hpp>
#include <veiling/memory.hpp>

#include <algorithm>
#include <utility>

#include <boost/endian.hpp>

namespace veiling::auction {

static constexpr std::span< const std::byte > singleton_key{};

store::store( program::system_interface* system ) noexcept:
    _system( system )
{}

bool store::has_admin() const
{
  return _system->get_object( std::to_underlying( key::admin ), singleton_key ).size();
}

result< protocol::account > store::admin() const
{
  auto object = _system->get_object( std::to_underlying( key::admin ), singleton_key );
  if( !object.size() )
    return std::unexpected( program_errc::uninitialized );

  protocol::account account;
  if( object.size() != account.size() )
    return std::unexpected( program_errc::unexpected_object );

  std::ranges::copy( object, account.begin() );
  return account;
}

result< protocol::address > store::get_address( key k ) const
{
  auto object = _system->get_object( std::to_underlying( k ), singleton_key );
  if( !object.size() )
    return std::unexpected( program_errc::uninitialized );

  protocol::address address;
  if( object.size() != address.size() )
    return std::unexpected( program_errc::unexpected_object );

  std::ranges::copy( object, address.begin() );
  return address;
}

result< protocol::amount > store::get_amount( key k, bool required ) const
{
  auto object = _system->get_object( std::to_underlying( k ), singleton_key );
  if( !object.size() )
  {
    if( required )
      return std::unexpected( program_errc::uninitialized );

    return protocol::amount( 0 );
  }

  auto value = protocol::decode_amount( object );
  if( !value )
    return std::unexpected( program_errc::unexpected_object );

  return value;
}

result< protocol::address > store::payment_asset() const
{
  return get_address( key::payment_asset );
}

result< protocol::address > store::prize_asset() const
{
  return get_address( key::prize_asset );
}

result< protocol::amount > store::starting_price() const
{
  return get_amount( key::starting_price, false );
}

result< protocol::amount > store::minimum_price() const
{
  return get_amount( key::minimum_price, false );
}

result< std::uint64_t > store::start_time() const
{
  auto object = _system->get_object( std::to_underlying( key::start_time ), singleton_key );
  if( !object.size() )
    return std::unexpected( program_errc::uninitialized );

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  auto time = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( time );
  return time;
}

result< protocol::amount > store::decay_rate() const
{
  return get_amount( key::decay_rate, true );
}

result< protocol::amount > store::nonce( const protocol::account& account ) const
{
  auto object = _system->get_object( std::to_underlying( key::nonce ), account );
  if( !object.size() )
    return protocol::amount( 0 );

  auto value = protocol::decode_amount( object );
  if( !value )
    return std::unexpected( program_errc::unexpected_object );

  return value;
}

std::error_code store::put_admin( const protocol::account& account )
{
  return _system->put_object( std::to_underlying( key::admin ), singleton_key, account );
}

std::error_code store::put_payment_asset( const protocol::address& asset )
{
  return _system->put_object( std::to_underlying( key::payment_asset ), singleton_key, asset );
}

std::error_code store::put_prize_asset( const protocol::address& asset )
{
  return _system->put_object( std::to_underlying( key::prize_asset ), singleton_key, asset );
}

std::error_code store::put_amount( key k, const protocol::amount& value )
{
  auto bytes = protocol::encode_amount( value );
  if( !bytes )
    return program_errc::invalid_argument;

  return _system->put_object( std::to_underlying( k ), singleton_key, *bytes );
}

std::error_code store::put_starting_price( const protocol::amount& price )
{
  return put_amount( key::starting_price, price );
}

std::error_code store::put_minimum_price( const protocol::amount& price )
{
  return put_amount( key::minimum_price, price );
}

std::error_code store::put_start_time( std::uint64_t time )
{
  boost::endian::native_to_little_inplace( time );
  return _system->put_object( std::to_underlying( key::start_time ), singleton_key, memory::as_bytes( time ) );
}

std::error_code store::put_decay_rate( const protocol::amount& rate )
{
  return put_amount( key::decay_rate, rate );
}

} // namespace veiling::auction

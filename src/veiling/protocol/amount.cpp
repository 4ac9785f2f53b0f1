#include <veiling/protocol/amount.hpp>

#include <iterator>

#include <boost/endian.hpp>

#include <veiling/memory.hpp>

namespace veiling::protocol {

result< std::vector< std::byte > > encode_amount( const amount& a )
{
  if( a < 0 )
    return std::unexpected( protocol_errc::negative_amount );

  std::vector< unsigned char > magnitude;
  if( !a.is_zero() )
    boost::multiprecision::export_bits( a, std::back_inserter( magnitude ), 8, false );

  if( magnitude.size() > max_amount_size )
    return std::unexpected( protocol_errc::amount_too_large );

  auto length = boost::endian::native_to_little( static_cast< std::uint32_t >( magnitude.size() ) );

  std::vector< std::byte > bytes;
  bytes.reserve( sizeof( length ) + magnitude.size() );

  auto length_bytes = memory::as_bytes( length );
  bytes.insert( bytes.end(), length_bytes.begin(), length_bytes.end() );

  auto magnitude_bytes = memory::as_bytes( magnitude );
  bytes.insert( bytes.end(), magnitude_bytes.begin(), magnitude_bytes.end() );

  return bytes;
}

result< amount > decode_amount( std::span< const std::byte > bytes )
{
  if( bytes.size() < sizeof( std::uint32_t ) )
    return std::unexpected( protocol_errc::truncated_amount );

  auto length = boost::endian::little_to_native( memory::bit_cast< std::uint32_t >( bytes ) );

  if( length > max_amount_size )
    return std::unexpected( protocol_errc::amount_too_large );

  auto magnitude = bytes.subspan( sizeof( std::uint32_t ) );

  if( magnitude.size() != length )
    return std::unexpected( protocol_errc::truncated_amount );

  return decode_magnitude( magnitude );
}

amount decode_magnitude( std::span< const std::byte > bytes )
{
  amount a;

  if( bytes.empty() )
    return a;

  auto begin = memory::pointer_cast< const unsigned char* >( bytes.data() );
  boost::multiprecision::import_bits( a, begin, begin + bytes.size(), 8, false );
  return a;
}

} // namespace veiling::protocol

#include <veiling/auction/configuration.hpp>

#include <utility>

namespace veiling::auction {

result< configuration > load( const store& s )
{
  configuration config;

  auto admin = s.admin();
  if( !admin )
    return std::unexpected( admin.error() );
  config.admin = *admin;

  auto payment_asset = s.payment_asset();
  if( !payment_asset )
    return std::unexpected( payment_asset.error() );
  config.payment_asset = *payment_asset;

  auto prize_asset = s.prize_asset();
  if( !prize_asset )
    return std::unexpected( prize_asset.error() );
  config.prize_asset = *prize_asset;

  auto starting_price = s.starting_price();
  if( !starting_price )
    return std::unexpected( starting_price.error() );
  config.starting_price = std::move( *starting_price );

  auto minimum_price = s.minimum_price();
  if( !minimum_price )
    return std::unexpected( minimum_price.error() );
  config.minimum_price = std::move( *minimum_price );

  auto start_time = s.start_time();
  if( !start_time )
    return std::unexpected( start_time.error() );
  config.start_time = *start_time;

  auto decay_rate = s.decay_rate();
  if( !decay_rate )
    return std::unexpected( decay_rate.error() );
  config.decay_rate = std::move( *decay_rate );

  return config;
}

std::error_code save( store& s, const configuration& config )
{
  if( s.has_admin() )
    return program_errc::already_initialized;

  if( auto error = s.put_admin( config.admin ); error )
    return error;

  if( auto error = s.put_payment_asset( config.payment_asset ); error )
    return error;

  if( auto error = s.put_prize_asset( config.prize_asset ); error )
    return error;

  if( auto error = s.put_starting_price( config.starting_price ); error )
    return error;

  if( auto error = s.put_start_time( config.start_time ); error )
    return error;

  if( auto error = s.put_minimum_price( config.minimum_price ); error )
    return error;

  return s.put_decay_rate( config.decay_rate );
}

} // namespace veiling::auction

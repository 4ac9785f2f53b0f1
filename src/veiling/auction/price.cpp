#include <veiling/auction/price.hpp>

namespace veiling::auction {

result< protocol::amount > compute_price( const configuration& config, std::uint64_t now )
{
  if( config.decay_rate <= 0 )
    return std::unexpected( program_errc::invalid_decay_rate );

  protocol::amount elapsed = now > config.start_time ? now - config.start_time : 0;
  protocol::amount price   = config.starting_price - elapsed / config.decay_rate;

  if( price < config.minimum_price )
    return config.minimum_price;

  return price;
}

} // namespace veiling::auction

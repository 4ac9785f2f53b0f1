#include <veiling/auction/price.hpp>
#include <veiling/auction/settlement.hpp>
#include <veiling/auction/token_client.hpp>
#include <veiling/log.hpp>

#include <algorithm>
#include <utility>

namespace veiling::auction {

result< settlement_receipt >
settle( program::system_interface* system, const configuration& config, const protocol::account& buyer )
{
  auto price = compute_price( config, system->get_time() );
  if( !price )
    return std::unexpected( price.error() );

  token_client payment( system, config.payment_asset );

  if( auto error = payment.transfer_from( buyer, config.admin, *price ); error )
  {
    LOG_DEBUG( veiling::log::instance(), "Payment of {} rejected: {}", *price, error.message() );
    return std::unexpected( program_errc::transfer_rejected );
  }

  protocol::account self;
  std::ranges::copy( system->get_self(), self.begin() );

  token_client prize( system, config.prize_asset );

  auto stock = prize.balance_of( self );
  if( !stock )
  {
    LOG_DEBUG( veiling::log::instance(), "Prize balance unavailable: {}", stock.error().message() );
    return std::unexpected( program_errc::transfer_rejected );
  }

  if( auto error = prize.transfer( self, buyer, *stock ); error )
  {
    LOG_DEBUG( veiling::log::instance(), "Prize transfer of {} rejected: {}", *stock, error.message() );
    return std::unexpected( program_errc::transfer_rejected );
  }

  return settlement_receipt{ .price = std::move( *price ), .prize = std::move( *stock ) };
}

} // namespace veiling::auction

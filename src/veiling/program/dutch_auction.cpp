#include <veiling/auction.hpp>
#include <veiling/log.hpp>
#include <veiling/program/dutch_auction.hpp>
#include <veiling/program/io.hpp>

#include <utility>

namespace veiling::program {

std::string_view dutch_auction::name() const noexcept
{
  return "dutch auction";
}

std::error_code dutch_auction::run( system_interface* system, const std::span< const std::string > arguments )
{
  std::uint32_t instruction = 0;
  if( auto error = read( system, instruction ); error )
    return error;

  auction::store store( system );

  switch( instruction )
  {
    case std::to_underlying( instruction::initialize ):
      {
        auction::configuration config;

        if( auto error = read( system,
                               config.admin,
                               config.payment_asset,
                               config.prize_asset,
                               config.starting_price,
                               config.minimum_price,
                               config.decay_rate );
            error )
          return error;

        config.start_time = system->get_time();

        if( auto error = auction::save( store, config ); error )
          return error;

        LOG_INFO( veiling::log::instance(),
                  "Auction initialized - Admin: {}, Price: {}, Floor: {}, Decay rate: {}, Start: {}",
                  veiling::log::hex{ config.admin.data(), config.admin.size() },
                  config.starting_price,
                  config.minimum_price,
                  config.decay_rate,
                  veiling::log::ledger_time{ config.start_time } );

        return program_errc::ok;
      }
    case std::to_underlying( instruction::nonce ):
      {
        auto admin = store.admin();
        if( !admin )
          return admin.error();

        auto nonce = store.nonce( *admin );
        if( !nonce )
          return nonce.error();

        return write( system, *nonce );
      }
    case std::to_underlying( instruction::buy ):
      {
        protocol::account buyer;
        if( auto error = read( system, buyer ); error )
          return error;

        auto config = auction::load( store );
        if( !config )
          return config.error();

        auto receipt = auction::settle( system, *config, buyer );
        if( !receipt )
          return receipt.error();

        LOG_INFO( veiling::log::instance(),
                  "Auction settled - Buyer: {}, Price: {}, Prize: {}",
                  veiling::log::hex{ buyer.data(), buyer.size() },
                  receipt->price,
                  receipt->prize );

        return program_errc::ok;
      }
    case std::to_underlying( instruction::get_price ):
      {
        auto config = auction::load( store );
        if( !config )
          return config.error();

        auto price = auction::compute_price( *config, system->get_time() );
        if( !price )
          return price.error();

        return write( system, *price );
      }
    default:
      return program_errc::invalid_instruction;
  }

  std::unreachable();
}

} // namespace veiling::program

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <veiling/auction.hpp>
#include <veiling/log.hpp>

namespace constants {

using namespace std::string_literals;

const auto price_section = "price"s;
const auto global_section = "global"s;

const auto help_option              = "help,h"s;
const auto version_option           = "version,v"s;
const auto basedir_option           = "basedir,d"s;
const auto basedir_default          = "."s;
const auto log_level_option         = "log-level,l"s;
const auto log_level_default        = "info"s;
const auto starting_price_option    = "starting-price,p"s;
const auto minimum_price_option     = "minimum-price,m"s;
const auto minimum_price_default    = "0"s;
const auto decay_rate_option        = "decay-rate,r"s;
const auto start_time_option        = "start-time,s"s;
constexpr std::uint64_t start_time_default = 0;
const auto at_option                = "at,t"s;
const auto steps_option             = "steps,n"s;
constexpr std::uint64_t steps_default      = 0;

} // namespace constants

using namespace boost;
using namespace veiling;

const std::string& version_string();

/**
 * Option lookup order is the command line, the service section of the config
 * file, its global section, then the default.
 */
template< typename T >
T get_option( const std::string& key,
              T default_value,
              const program_options::variables_map& cli_args,
              const YAML::Node& service_config = YAML::Node(),
              const YAML::Node& global_config  = YAML::Node() )
{
  auto name = key.substr( 0, key.find( ',' ) );

  if( cli_args.count( name ) )
    return cli_args[ name ].as< T >();

  if( service_config && service_config[ name ] )
    return service_config[ name ].as< T >();

  if( global_config && global_config[ name ] )
    return global_config[ name ].as< T >();

  return default_value;
}

static protocol::amount parse_amount( const std::string& name, const std::string& value )
{
  protocol::amount a;

  try
  {
    a = protocol::amount( value.c_str() );
  }
  catch( const std::exception& )
  {
    throw std::invalid_argument( name + " is not an integer: " + value );
  }

  if( a < 0 )
    throw std::invalid_argument( name + " must not be negative" );

  return a;
}

static protocol::amount print_price( const auction::configuration& config, std::uint64_t time )
{
  auto price = auction::compute_price( config, time );
  if( !price )
    throw std::runtime_error( "could not compute price: " + price.error().message() );

  std::cout << time << ' ' << *price << '\n';
  return *price;
}

int main( int argc, char** argv )
{
  std::string log_level;
  std::vector< std::uint64_t > at;
  std::uint64_t steps = 0;
  auction::configuration config;

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()          , "Print this help message and exit" )
      ( constants::version_option.data()       , "Print version string and exit" )
      ( constants::basedir_option.data()       , program_options::value< std::string >()->default_value( constants::basedir_default ), "Directory holding config.yml" )
      ( constants::log_level_option.data()     , program_options::value< std::string >(), "The log filtering level" )
      ( constants::starting_price_option.data(), program_options::value< std::string >(), "The price at the start time" )
      ( constants::minimum_price_option.data() , program_options::value< std::string >(), "The price floor" )
      ( constants::decay_rate_option.data()    , program_options::value< std::string >(), "Seconds for the price to drop by one unit" )
      ( constants::start_time_option.data()    , program_options::value< std::uint64_t >(), "The auction start time, in seconds" )
      ( constants::at_option.data()            , program_options::value< std::vector< std::uint64_t > >()->composing(), "Print the price at this time, in seconds (repeatable)" )
      ( constants::steps_option.data()         , program_options::value< std::uint64_t >(), "Print up to this many price steps, ending at the floor" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node yaml;
    YAML::Node global_config;
    YAML::Node price_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      yaml          = YAML::LoadFile( yaml_config.string() );
      global_config = yaml[ constants::global_section ];
      price_config  = yaml[ constants::price_section ];
    }

    // clang-format off
    log_level                = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, price_config, global_config );
    auto starting_price      = get_option< std::string >( constants::starting_price_option, "", args, price_config, global_config );
    auto minimum_price       = get_option< std::string >( constants::minimum_price_option, constants::minimum_price_default, args, price_config, global_config );
    auto decay_rate          = get_option< std::string >( constants::decay_rate_option, "", args, price_config, global_config );
    config.start_time        = get_option< std::uint64_t >( constants::start_time_option, constants::start_time_default, args, price_config, global_config );
    at                       = get_option< std::vector< std::uint64_t > >( constants::at_option, {}, args, price_config, global_config );
    steps                    = get_option< std::uint64_t >( constants::steps_option, constants::steps_default, args, price_config, global_config );
    // clang-format on

    veiling::log::initialize( log_level );

    LOG_DEBUG( veiling::log::instance(), "{}", version_string() );

    if( yaml.IsNull() )
      LOG_DEBUG( veiling::log::instance(), "Could not find config (config.yml or config.yaml expected)" );

    if( starting_price.empty() )
      throw std::invalid_argument( "starting-price is required" );

    if( decay_rate.empty() )
      throw std::invalid_argument( "decay-rate is required" );

    config.starting_price = parse_amount( "starting-price", starting_price );
    config.minimum_price  = parse_amount( "minimum-price", minimum_price );
    config.decay_rate     = parse_amount( "decay-rate", decay_rate );

    if( config.decay_rate == 0 )
      throw std::invalid_argument( "decay-rate must be positive" );

    if( config.minimum_price > config.starting_price )
      LOG_WARNING( veiling::log::instance(),
                   "Minimum price {} exceeds starting price {}",
                   config.minimum_price,
                   config.starting_price );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  try
  {
    for( auto time: at )
      print_price( config, time );

    for( std::uint64_t step = 0; step < steps; ++step )
    {
      protocol::amount offset = protocol::amount( step ) * config.decay_rate;
      if( offset > std::numeric_limits< std::uint64_t >::max() - config.start_time )
        break;

      auto time = config.start_time + offset.convert_to< std::uint64_t >();
      if( print_price( config, time ) <= config.minimum_price )
        break;
    }

    if( at.empty() && !steps )
    {
      auto now = std::chrono::duration_cast< std::chrono::seconds >(
                   std::chrono::system_clock::now().time_since_epoch() )
                   .count();
      print_price( config, static_cast< std::uint64_t >( now ) );
    }
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( veiling::log::instance(), "An unexpected error has occurred: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

const std::string& version_string()
{
  static const std::string v_str = "Veiling Price v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                                   + std::to_string( PROJECT_MINOR_VERSION ) + "."
                                   + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}

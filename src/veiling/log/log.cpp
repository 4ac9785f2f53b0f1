#include <veiling/log/log.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace veiling::log {

quill::LogLevel level_from_string( std::string_view level )
{
  if( level == "trace" )
    return quill::LogLevel::TraceL1;

  if( level == "warn" )
    return quill::LogLevel::Warning;

  try
  {
    return quill::loglevel_from_string( std::string( level ) );
  }
  catch( const std::exception& )
  {
    throw std::invalid_argument( "unknown log level: " + std::string( level ) );
  }
}

void initialize( std::string_view level )
{
  auto log_level = level_from_string( level );

  if( !quill::Backend::is_running() )
  {
    constexpr auto sleep_duration = std::chrono::milliseconds{ 50 };

    quill::BackendOptions options;
    options.thread_name    = "veiling_log";
    options.sleep_duration = sleep_duration;
    options.error_notifier = []( const std::string& err ) noexcept
    {
      LOG_ERROR( veiling::log::instance(), "Logging backend failure: {}", err );
    };

    quill::Backend::start( options );
  }

  instance()->set_log_level( log_level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "veiling",
    frontend::create_or_get_sink< quill::ConsoleSink >( "veiling_console" ),
    quill::PatternFormatterOptions{ "%(time) %(log_level:<9) %(short_source_location:<32) %(message)",
                                    "%Y-%m-%dT%H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace veiling::log

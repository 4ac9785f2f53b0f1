#pragma once

#include <cstdint>
#include <string_view>

#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/core/LogLevel.h>

#include <veiling/log/formatter.hpp>

namespace veiling::log {

// Settlement logging is sparse, a bounded queue that blocks is preferred over dropping receipts.
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::BoundedBlocking;
  static constexpr std::size_t initial_queue_capacity             = 131'072;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 800;
  static constexpr std::size_t unbounded_queue_max_capacity       = 0;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

/**
 * Maps a level name to a quill level. Accepts quill's own names plus "trace" and "warn".
 *
 * @throws std::invalid_argument on an unknown level name
 */
quill::LogLevel level_from_string( std::string_view level );

/**
 * Starts the logging backend and sets the level of the root logger. Safe to call more than once.
 */
void initialize( std::string_view level = "info" );

logger* instance() noexcept;

} // namespace veiling::log

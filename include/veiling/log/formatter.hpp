#pragma once

#include <chrono>
#include <cstdint>
#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <veiling/encode.hpp>
#include <veiling/protocol/amount.hpp>

namespace veiling::log {

struct hex_tag
{};

// Accounts and other raw byte strings
using hex = quill::BinaryData< hex_tag >;

// Ledger time in seconds since the epoch, printed as UTC with the raw value alongside
struct ledger_time
{
  std::uint64_t seconds;
};

} // namespace veiling::log

template<>
struct fmtquill::formatter< veiling::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const veiling::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                veiling::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< veiling::log::hex >: quill::BinaryDataDeferredFormatCodec< veiling::log::hex >
{};

template<>
struct fmtquill::formatter< veiling::log::ledger_time >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const veiling::log::ledger_time& t, format_context& ctx ) const
  {
    std::chrono::sys_seconds point{ std::chrono::seconds( t.seconds ) };
    std::chrono::year_month_day date{ std::chrono::floor< std::chrono::days >( point ) };
    std::chrono::hh_mm_ss clock{ point - std::chrono::floor< std::chrono::days >( point ) };

    return fmtquill::format_to( ctx.out(),
                                "{:04}-{:02}-{:02} {:02}:{:02}:{:02}Z ({})",
                                static_cast< int >( date.year() ),
                                static_cast< unsigned >( date.month() ),
                                static_cast< unsigned >( date.day() ),
                                clock.hours().count(),
                                clock.minutes().count(),
                                clock.seconds().count(),
                                t.seconds );
  }
};

template<>
struct quill::Codec< veiling::log::ledger_time >: quill::DeferredFormatCodec< veiling::log::ledger_time >
{};

template<>
struct fmtquill::formatter< veiling::protocol::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const veiling::protocol::amount& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", a.str() );
  }
};

template<>
struct quill::Codec< veiling::protocol::amount >: quill::DeferredFormatCodec< veiling::protocol::amount >
{};

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <veiling/protocol/account.hpp>

namespace veiling::protocol {

struct program_input
{
  std::vector< std::string > arguments;
  std::vector< std::byte > stdin;
};

struct program_output
{
  std::int32_t code = 0;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

struct program_frame final: program_input,
                            program_output
{
  account id{};
  std::uint32_t depth = 0;
};

} // namespace veiling::protocol

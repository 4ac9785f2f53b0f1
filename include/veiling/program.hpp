#pragma once

#include <veiling/program/dutch_auction.hpp>
#include <veiling/program/error.hpp>
#include <veiling/program/io.hpp>
#include <veiling/program/program.hpp>
#include <veiling/program/system_interface.hpp>
#include <veiling/program/token.hpp>

#pragma once

#include <veiling/protocol/account.hpp>
#include <veiling/protocol/amount.hpp>
#include <veiling/protocol/block.hpp>
#include <veiling/protocol/error.hpp>
#include <veiling/protocol/program.hpp>
#include <veiling/protocol/transaction.hpp>

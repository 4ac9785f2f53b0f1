#pragma once

#include <veiling/auction/configuration.hpp>
#include <veiling/auction/error.hpp>
#include <veiling/auction/price.hpp>
#include <veiling/auction/settlement.hpp>
#include <veiling/auction/store.hpp>
#include <veiling/auction/token_client.hpp>

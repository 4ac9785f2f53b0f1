#pragma once

#include <veiling/state_db/state_delta.hpp>
#include <veiling/state_db/state_node.hpp>
#include <veiling/state_db/types.hpp>

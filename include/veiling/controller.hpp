#pragma once

#include <veiling/controller/controller.hpp>
#include <veiling/controller/error.hpp>
#include <veiling/controller/state.hpp>

#pragma once

#include <veiling/memory/memory.hpp>

#pragma once

#include <veiling/encode/hex.hpp>

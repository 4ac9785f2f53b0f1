#pragma once

#include <veiling/log/log.hpp>

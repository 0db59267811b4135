#pragma once

/// @file brk.hpp
/// @brief Umbrella header for the brick-breaker simulation core.

#include "brk/version.hpp"
#include "brk/core/result.hpp"
#include "brk/game/vector.hpp"
#include "brk/game/entities.hpp"
#include "brk/game/level_loader.hpp"
#include "brk/game/simulation.hpp"
#include "brk/game/level_lifecycle.hpp"

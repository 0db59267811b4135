#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for the foundation layer.
///
/// Error codes, GameError, GameResult aliases, configuration management
/// and logging.

#include "brk/foundation/config_manager.hpp"
#include "brk/foundation/error_code.hpp"
#include "brk/foundation/game_error.hpp"
#include "brk/foundation/game_logger.hpp"
#include "brk/foundation/game_result.hpp"

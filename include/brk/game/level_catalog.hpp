#pragma once

/// @file level_catalog.hpp
/// @brief Reads level descriptors from YAML.
///
/// Format:
/// @code
///   levels:
///     - name: "Opening"                      # optional
///       size: { width: 100, height: 80 }
///       paddle: { position: { x: 42, y: 74 }, width: 16, height: 2 }
///       ball: { center: { x: 50, y: 40 }, radius: 1 }
///       blocks:
///         - { position: { x: 5, y: 5 }, width: 10, height: 4, density: 2 }
/// @endcode

#include <filesystem>
#include <string_view>
#include <vector>

#include "brk/foundation/game_result.hpp"
#include "brk/game/level_types.hpp"

namespace breakout::game {

/// Parse a level catalog from YAML text.
///
/// Every parsed level is also checked with ValidateLevel().
/// @return The levels in file order, or LevelParseFailed,
///         EmptyLevelCatalog or InvalidLevel.
[[nodiscard]] foundation::GameResult<std::vector<LevelDescriptor>>
ParseLevelCatalog(std::string_view yaml);

/// Load and parse a level catalog file.
[[nodiscard]] foundation::GameResult<std::vector<LevelDescriptor>>
LoadLevelCatalog(const std::filesystem::path& path);

}  // namespace breakout::game

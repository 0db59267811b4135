/// @file level_catalog.cpp
/// @brief YAML level catalog parsing.

#include "brk/game/level_catalog.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

#include "brk/foundation/game_logger.hpp"
#include "brk/game/level_loader.hpp"

namespace breakout::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

using Levels = std::vector<LevelDescriptor>;

/// Thrown inside the parser only; converted to GameError at the boundary.
struct FieldError {
    std::string path;
};

YAML::Node require(const YAML::Node& node, const char* key, const std::string& path) {
    auto child = node[key];
    if (!child) {
        throw FieldError{path + "." + key};
    }
    return child;
}

template <typename T>
T scalar(const YAML::Node& node, const char* key, const std::string& path) {
    auto child = require(node, key, path);
    try {
        return child.as<T>();
    } catch (const YAML::BadConversion&) {
        throw FieldError{path + "." + key};
    }
}

Vector parseVector(const YAML::Node& node, const std::string& path) {
    return {scalar<float>(node, "x", path), scalar<float>(node, "y", path)};
}

BlockDescriptor parseBlock(const YAML::Node& node, const std::string& path) {
    BlockDescriptor block;
    block.position = parseVector(require(node, "position", path), path + ".position");
    block.width = scalar<float>(node, "width", path);
    block.height = scalar<float>(node, "height", path);
    block.density = node["density"] ? scalar<int32_t>(node, "density", path) : 1;
    return block;
}

LevelDescriptor parseLevel(const YAML::Node& node, std::size_t index) {
    const std::string path = "levels[" + std::to_string(index) + "]";
    LevelDescriptor level;
    level.name = node["name"] ? scalar<std::string>(node, "name", path)
                              : "level " + std::to_string(index + 1);

    auto size = require(node, "size", path);
    level.size = {scalar<float>(size, "width", path + ".size"),
                  scalar<float>(size, "height", path + ".size")};

    auto paddle = require(node, "paddle", path);
    level.paddle.position = parseVector(require(paddle, "position", path + ".paddle"),
                                        path + ".paddle.position");
    level.paddle.width = scalar<float>(paddle, "width", path + ".paddle");
    level.paddle.height = scalar<float>(paddle, "height", path + ".paddle");

    auto ball = require(node, "ball", path);
    level.ball.center = parseVector(require(ball, "center", path + ".ball"),
                                    path + ".ball.center");
    level.ball.radius = scalar<float>(ball, "radius", path + ".ball");

    if (auto blocks = node["blocks"]) {
        if (!blocks.IsSequence()) {
            throw FieldError{path + ".blocks"};
        }
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            level.blocks.push_back(
                parseBlock(blocks[i], path + ".blocks[" + std::to_string(i) + "]"));
        }
    }
    return level;
}

GameResult<Levels> parseFailed(std::string message) {
    return GameResult<Levels>::err(GameError(ErrorCode::LevelParseFailed, std::move(message)));
}

GameResult<Levels> parseRoot(const YAML::Node& root) {
    if (!root.IsMap() || !root["levels"] || !root["levels"].IsSequence()) {
        return parseFailed("catalog needs a 'levels' sequence");
    }
    auto list = root["levels"];
    if (list.size() == 0) {
        return GameResult<Levels>::err(
            GameError(ErrorCode::EmptyLevelCatalog, "catalog has no levels"));
    }

    Levels levels;
    levels.reserve(list.size());
    try {
        for (std::size_t i = 0; i < list.size(); ++i) {
            levels.push_back(parseLevel(list[i], i));
        }
    } catch (const FieldError& e) {
        return parseFailed("missing or malformed field: " + e.path);
    } catch (const YAML::Exception& e) {
        // A scalar where a map was expected, and similar shape errors.
        return parseFailed(std::string("malformed level: ") + e.what());
    }

    for (std::size_t i = 0; i < levels.size(); ++i) {
        auto valid = ValidateLevel(levels[i]);
        if (!valid) {
            const auto& err = valid.error();
            std::string message = levels[i].name + ": " + std::string(err.message());
            if (const auto* block = err.context<std::size_t>()) {
                return GameResult<Levels>::err(
                    GameError(ErrorCode::InvalidLevel, std::move(message), *block));
            }
            return GameResult<Levels>::err(GameError(ErrorCode::InvalidLevel, std::move(message)));
        }
    }
    return GameResult<Levels>::ok(std::move(levels));
}

}  // namespace

GameResult<Levels> ParseLevelCatalog(std::string_view yaml) {
    try {
        return parseRoot(YAML::Load(std::string(yaml)));
    } catch (const YAML::ParserException& e) {
        return parseFailed(std::string("YAML parse error: ") + e.what());
    }
}

GameResult<Levels> LoadLevelCatalog(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return parseFailed("failed to open level catalog: " + path.string());
    } catch (const YAML::ParserException& e) {
        return parseFailed(std::string("YAML parse error: ") + e.what());
    }

    auto result = parseRoot(root);
    if (result) {
        foundation::LogContext ctx;
        ctx.extra["path"] = path.string();
        ctx.extra["levels"] = std::to_string(result.value().size());
        foundation::GameLogger::instance().logWithContext(
            foundation::LogLevel::Info, foundation::LogCategory::Level,
            "Level catalog loaded", ctx);
    }
    return result;
}

}  // namespace breakout::game

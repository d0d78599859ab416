#include "BrickArcade.h"
#include "BrickAsteroids.h"
#include "BrickBreakout.h"
#include "BrickSnake.h"
#include "BrickTetris.h"

#include <spdlog/spdlog.h>

static std::string scoreFilePath(const Json::Value &config) {
    const Json::Value &options = config["options"];
    if (options.isObject() && options.isMember("High Score File")) {
        return options["High Score File"].asString();
    }
    return "high-scores.json";
}

BrickArcade::BrickArcade(Json::Value &config, GridSurface *s)
    : surface(s), highScores(scoreFilePath(config)) {
    if (surface == nullptr) {
        throw MissingSurfaceError("arcade");
    }
    highScores.load();

    Json::Value rows = config["games"];
    if (!rows.isArray() || rows.empty()) {
        rows = Json::Value(Json::arrayValue);
        for (auto name : {"Snake", "Breakout", "Asteroids", "Tetris"}) {
            Json::Value row;
            row["name"] = name;
            rows.append(row);
        }
    }
    for (auto &row : rows) {
        std::unique_ptr<BrickArcadeGame> g = createGame(row);
        if (g) {
            games.push_back(std::move(g));
        }
    }
    spdlog::info("Arcade ready with {} games, scores in {}", games.size(), highScores.getPath());
}

std::unique_ptr<BrickArcadeGame> BrickArcade::createGame(Json::Value &row) {
    std::string name = row["name"].asString();
    if (name == "Snake") {
        return std::unique_ptr<BrickArcadeGame>(new BrickSnake(row, surface, &highScores));
    } else if (name == "Breakout") {
        return std::unique_ptr<BrickArcadeGame>(new BrickBreakout(row, surface, &highScores));
    } else if (name == "Asteroids") {
        return std::unique_ptr<BrickArcadeGame>(new BrickAsteroids(row, surface, &highScores));
    } else if (name == "Tetris") {
        return std::unique_ptr<BrickArcadeGame>(new BrickTetris(row, surface, &highScores));
    }
    spdlog::warn("Unknown game '{}' in arcade configuration", name);
    return nullptr;
}

BrickArcadeGame *BrickArcade::game(const std::string &name) const {
    for (auto &g : games) {
        if (g->getName() == name) {
            return g.get();
        }
    }
    return nullptr;
}

std::vector<std::string> BrickArcade::gameNames() const {
    std::vector<std::string> names;
    for (auto &g : games) {
        names.push_back(g->getName());
    }
    return names;
}

bool BrickArcade::selectGame(const std::string &name) {
    BrickArcadeGame *g = game(name);
    if (g == nullptr) {
        spdlog::warn("No game named '{}'", name);
        return false;
    }
    g->reset();
    current = g;
    spdlog::info("[{}] selected, high score {}", name, g->highestScore());
    return true;
}

void BrickArcade::returnToMenu() {
    if (current) {
        spdlog::info("[{}] back to menu", current->getName());
    }
    current = nullptr;
    surface->clearBuffer();
    surface->flushBuffer();
}

void BrickArcade::button(const std::string &button) {
    GameKey key;
    bool press;
    if (parseButton(button, key, press) && key == GameKey::Menu) {
        if (press) {
            returnToMenu();
        }
        return;
    }
    if (current) {
        current->button(button);
    }
}

void BrickArcade::tick() {
    uint64_t counter = ticks.advance();
    if (current) {
        current->tick(counter);
    }
}

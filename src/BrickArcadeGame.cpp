#include "BrickArcadeGame.h"
#include "BrickScores.h"

#include <algorithm>
#include <unordered_map>

#include <spdlog/spdlog.h>

static const std::unordered_map<std::string, GameKey> BUTTONS = {
    {"Up", GameKey::Up},
    {"Down", GameKey::Down},
    {"Left", GameKey::Left},
    {"Right", GameKey::Right},
    {"A Button", GameKey::Confirm},
    {"Fire", GameKey::Accelerate},
    {"B Button", GameKey::HoldSwap},
    {"Drop", GameKey::InstantDrop},
    {"Start", GameKey::Pause},
    {"Select", GameKey::Reset},
    {"Back", GameKey::Menu},
};

bool parseButton(const std::string &button, GameKey &key, bool &press) {
    static const std::string SEP = " - ";
    std::string name = button;
    press = true;
    size_t pos = button.rfind(SEP);
    if (pos != std::string::npos) {
        std::string state = button.substr(pos + SEP.size());
        if (state == "Pressed") {
            press = true;
        } else if (state == "Released") {
            press = false;
        } else {
            return false;
        }
        name = button.substr(0, pos);
    }
    auto it = BUTTONS.find(name);
    if (it == BUTTONS.end()) {
        key = GameKey::Unknown;
        return false;
    }
    key = it->second;
    return true;
}

BrickArcadeGame::BrickArcadeGame(Json::Value &cfg, GridSurface *s, HighScoreStore *hs)
    : config(cfg), surface(s), scores(hs) {
    if (surface == nullptr) {
        throw MissingSurfaceError("arcade game");
    }
    std::string seed = findOption("Seed", "");
    if (!seed.empty()) {
        try {
            ctx.seed(static_cast<uint32_t>(std::stoul(seed)));
        } catch (const std::exception &ex) {
            spdlog::warn("Ignoring invalid Seed option '{}': {}", seed, ex.what());
        }
    }
}

void BrickArcadeGame::button(const std::string &button) {
    GameKey key;
    bool press;
    if (!parseButton(button, key, press)) {
        spdlog::debug("[{}] ignoring button '{}'", getName(), button);
        return;
    }
    handleInput(key, press);
}

void BrickArcadeGame::handleInput(GameKey key, bool press) {
    if (!press) {
        return;
    }
    if (key == GameKey::Pause && running) {
        paused = !paused;
        spdlog::info("[{}] {}", getName(), paused ? "Game paused" : "Game unpaused");
    } else if (key == GameKey::Reset) {
        reset();
    }
}

void BrickArcadeGame::tick(uint64_t counter) {
    if (!running || paused) {
        return;
    }
    updateEntities(counter);
    manage(counter);
    CopyToModel();
}

void BrickArcadeGame::updateEntities(uint64_t counter) {
    if (paused) {
        return;
    }
    for (auto &g : groups) {
        double rate = rateFor(g.first);
        for (auto &e : g.second) {
            e->update(counter, rate);
        }
    }
}

void BrickArcadeGame::manage(uint64_t counter) {
    if (!running || paused) {
        return;
    }
    manageRound(counter);
    if (!running) {
        return;
    }
    if (checkVictory()) {
        endRound(GameOutcome::Victory);
    } else if (checkDefeat()) {
        endRound(GameOutcome::Defeat);
    }
}

void BrickArcadeGame::reset() {
    running = true;
    paused = false;
    result = GameOutcome::None;
    score = 0;
    clearEntities();
    if (scores) {
        highest = std::max(highest, scores->get(getName()));
    }
    initEntities();
    spdlog::debug("[{}] reset, {} entities", getName(), entityCount());
}

double BrickArcadeGame::rateFor(EntityKind) const {
    return currentSpeed;
}

void BrickArcadeGame::addScore(int points) {
    score += points;
    updateScore();
}

void BrickArcadeGame::updateScore() {
    if (score > MAX_SCORE) {
        score = MAX_SCORE;
    }
    if (score > highest) {
        highest = score;
        if (scores) {
            scores->put(getName(), highest);
        }
    }
}

void BrickArcadeGame::endRound(GameOutcome o) {
    updateScore();
    clearEntities();
    running = false;
    result = o;
    if (o == GameOutcome::Victory) {
        spdlog::info("[{}] Congratulations! Score: {}", getName(), score);
    } else {
        spdlog::info("[{}] Better luck next time... Score: {}", getName(), score);
    }
}

EntityGroup &BrickArcadeGame::entities(EntityKind kind) {
    return groups[kind];
}

const EntityGroup &BrickArcadeGame::group(EntityKind kind) const {
    static const EntityGroup EMPTY;
    auto it = groups.find(kind);
    if (it == groups.end()) {
        return EMPTY;
    }
    return it->second;
}

size_t BrickArcadeGame::entityCount() const {
    size_t n = 0;
    for (auto &g : groups) {
        n += g.second.size();
    }
    return n;
}

void BrickArcadeGame::clearEntities() {
    for (auto &g : groups) {
        g.second.clear();
    }
    ctx.bombs.clear();
}

void BrickArcadeGame::CopyToModel() {
    surface->clearBuffer();
    if (running) {
        for (auto &g : groups) {
            for (auto &e : g.second) {
                const Position &p = e->position();
                if (insideGrid(p)) {
                    surface->setCell(p.col, p.row, e->color());
                }
            }
        }
    }
    surface->flushBuffer();
}

std::string BrickArcadeGame::findOption(const std::string &name, const std::string &def) const {
    const Json::Value &options = config["options"];
    if (options.isObject() && options.isMember(name)) {
        return options[name].asString();
    }
    return def;
}

int BrickArcadeGame::optionInt(const std::string &name, int def) const {
    std::string v = findOption(name, "");
    if (v.empty()) {
        return def;
    }
    try {
        return std::stoi(v);
    } catch (const std::exception &ex) {
        spdlog::warn("Ignoring invalid {} option '{}': {}", name, v, ex.what());
    }
    return def;
}

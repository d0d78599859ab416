#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "BrickArcade.h"
#include "BrickSurface.h"

// Headless runner: replays a scripted button sequence against one game and
// prints the final frame.
//
//   { "game": "Snake", "ticks": 600, "logLevel": "debug",
//     "script": [ { "tick": 10, "button": "Left - Pressed" } ],
//     "options": { "High Score File": "high-scores.json" },
//     "games": [ { "name": "Snake", "options": { "Seed": "7" } } ] }
int main(int argc, char **argv) {
    if (argc < 2) {
        spdlog::error("usage: {} <config.json>", argv[0]);
        return 1;
    }

    std::ifstream in(argv[1]);
    if (!in.is_open()) {
        spdlog::error("Could not open {}", argv[1]);
        return 1;
    }
    Json::CharReaderBuilder builder;
    Json::Value config;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &config, &errs) || !config.isObject()) {
        spdlog::error("Could not parse {}: {}", argv[1], errs);
        return 1;
    }

    if (config.isMember("logLevel")) {
        spdlog::set_level(spdlog::level::from_str(config["logLevel"].asString()));
    }

    std::map<uint64_t, std::vector<std::string>> script;
    for (const auto &step : config["script"]) {
        script[step["tick"].asUInt64()].push_back(step["button"].asString());
    }
    uint64_t total = config.get("ticks", 600).asUInt64();

    FrameBuffer frame;
    BrickArcade arcade(config, &frame);
    std::string name = config.get("game", "Snake").asString();
    if (!arcade.selectGame(name)) {
        spdlog::error("Unknown game '{}'", name);
        return 1;
    }

    for (uint64_t t = 1; t <= total; t++) {
        auto it = script.find(t);
        if (it != script.end()) {
            for (auto &b : it->second) {
                arcade.button(b);
            }
        }
        arcade.tick();
    }

    BrickArcadeGame *g = arcade.activeGame();
    if (g) {
        const char *state = "running";
        if (g->outcome() == GameOutcome::Victory) {
            state = "victory";
        } else if (g->outcome() == GameOutcome::Defeat) {
            state = "defeat";
        }
        spdlog::info("[{}] after {} ticks: {}, score {}, high score {}", g->getName(), total,
                     state, g->currentScore(), g->highestScore());
    }
    printf("%s", frame.toText().c_str());
    return 0;
}

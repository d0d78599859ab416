#include "BrickScores.h"
#include "BrickSnake.h"
#include "BrickSurface.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

static std::string readFile(const std::string &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main() {
    printf("=== high score test suite ===\n");

    const std::string path = "brickgame_test_scores.json";

    // --- First run creates the file ---
    {
        std::remove(path.c_str());
        HighScoreStore store(path);
        assert(!store.isAvailable());
        assert(store.load());
        assert(store.isAvailable());
        assert(store.getPath() == path);
        for (auto name : {"Snake", "Breakout", "Asteroids", "Tetris"}) {
            assert(store.get(name) == 0);
        }

        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errs;
        std::ifstream in(path);
        assert(Json::parseFromStream(builder, in, &root, &errs));
        assert(root.isObject());
        assert(root.size() == 4);
        assert(root["Tetris"].asInt() == 0);
        printf("  [OK] Created on first run\n");
    }

    // --- Scores persist across loads ---
    {
        HighScoreStore store(path);
        assert(store.load());
        assert(store.put("Snake", 345));
        assert(store.get("Snake") == 345);
        assert(store.get("Pinball") == 0);

        HighScoreStore again(path);
        assert(again.load());
        assert(again.get("Snake") == 345);
        assert(again.get("Breakout") == 0);
        printf("  [OK] Persisted\n");
    }

    // --- A game picks up its recorded best and raises it ---
    {
        HighScoreStore store(path);
        assert(store.load());
        Json::Value config;
        config["options"]["Seed"] = "3";
        FrameBuffer fb;
        BrickSnake snake(config, &fb, &store);
        assert(snake.highestScore() == 345);

        // grow a long snake straight down the middle and feed it once
        std::vector<Position> body;
        for (int r = 10; r >= 0; r--) {
            body.push_back(Position(4, r));
        }
        snake.setBody(body, Direction::Down);
        snake.placeFood(Position(4, 11));
        snake.step();
        assert(snake.currentScore() == 15);
        assert(snake.highestScore() == 345);
        assert(store.get("Snake") == 345);
        printf("  [OK] Game reads the record\n");
    }

    // --- Corrupt file disables persistence without failing ---
    {
        {
            std::ofstream out(path, std::ios::trunc);
            out << "{ this is not json";
        }
        HighScoreStore store(path);
        assert(!store.load());
        assert(!store.isAvailable());
        assert(store.get("Snake") == 0);
        assert(!store.put("Snake", 10));
        assert(store.get("Snake") == 10);
        assert(readFile(path) == "{ this is not json");

        {
            std::ofstream out(path, std::ios::trunc);
            out << "[1, 2, 3]";
        }
        HighScoreStore arr(path);
        assert(!arr.load());
        assert(!arr.isAvailable());

        {
            std::ofstream out(path, std::ios::trunc);
            out << "{\"Snake\": 5000000000, \"Breakout\": 1e10, \"Asteroids\": -4, \"Tetris\": 7}";
        }
        HighScoreStore huge(path);
        assert(huge.load());
        assert(huge.isAvailable());
        assert(huge.get("Snake") == 0);
        assert(huge.get("Breakout") == 0);
        assert(huge.get("Asteroids") == 0);
        assert(huge.get("Tetris") == 7);
        printf("  [OK] Corrupt file\n");
    }

    std::remove(path.c_str());
    printf("\n=== All tests passed ===\n");
    return 0;
}

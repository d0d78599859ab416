#include "BrickScores.h"

#include <fstream>

#include <spdlog/spdlog.h>

static const char *GAME_NAMES[] = {"Snake", "Breakout", "Asteroids", "Tetris"};

HighScoreStore::HighScoreStore(const std::string &p) : path(p), scores(Json::objectValue) {
}

bool HighScoreStore::load() {
    available = false;
    scores = Json::Value(Json::objectValue);

    std::ifstream in(path);
    if (!in.is_open()) {
        // First run: create the file with every game at zero.
        for (auto name : GAME_NAMES) {
            scores[name] = 0;
        }
        available = true;
        if (!write()) {
            available = false;
            return false;
        }
        spdlog::info("[Scores] created {}", path);
        return true;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
        spdlog::warn("[Scores] failed to read '{}': {}", path, errs.empty() ? "not an object" : errs);
        return false;
    }
    for (const auto &name : root.getMemberNames()) {
        const Json::Value &v = root[name];
        if (v.isInt() && v.asInt() >= 0) {
            scores[name] = v.asInt();
        } else {
            spdlog::warn("[Scores] ignoring invalid score for '{}' in {}", name, path);
        }
    }
    available = true;
    return true;
}

int HighScoreStore::get(const std::string &game) const {
    if (!scores.isMember(game)) {
        return 0;
    }
    return scores[game].asInt();
}

bool HighScoreStore::put(const std::string &game, int score) {
    scores[game] = score;
    if (!available) {
        return false;
    }
    return write();
}

bool HighScoreStore::write() {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        spdlog::warn("[Scores] failed to update '{}'", path);
        return false;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    out << Json::writeString(builder, scores);
    if (!out.good()) {
        spdlog::warn("[Scores] failed to update '{}'", path);
        return false;
    }
    return true;
}

#ifndef BRICKSCORES_H
#define BRICKSCORES_H

#include <string>

#include <json/json.h>

// Flat game-name -> high-score record kept in a JSON file. Every failure is
// logged and swallowed: the games keep their in-memory scores.
class HighScoreStore {
public:
    explicit HighScoreStore(const std::string &path);

    bool load();
    int get(const std::string &game) const;
    bool put(const std::string &game, int score);

    bool isAvailable() const { return available; }
    const std::string &getPath() const { return path; }

private:
    bool write();

    std::string path;
    Json::Value scores;
    bool available = false;
};

#endif

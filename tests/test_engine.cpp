#include "BrickArcadeGame.h"
#include "BrickSurface.h"

#include <cassert>
#include <cstdio>
#include <string>

// Minimal game driving the shared lifecycle: one falling cell and one fixed
// cell, ending whenever the test says so.
class ProbeGame : public BrickArcadeGame {
public:
    ProbeGame(Json::Value &config, GridSurface *surface) : BrickArcadeGame(config, surface) {
        reset();
    }

    const std::string &getName() const override {
        static const std::string name = "Probe";
        return name;
    }

    void grant(int points) { addScore(points); }

    int rounds = 0;
    bool win = false;
    bool lose = false;

protected:
    void initEntities() override {
        rounds = 0;
        win = false;
        lose = false;
        currentSpeed = TICKS_PER_SECOND;
        entities(EntityKind::Body).push_back(ctx.makeCell(Position(1, 1), LINE_COLOR, Direction::Down));
        entities(EntityKind::Food).push_back(ctx.makeCell(Position(8, 18), SHADE_COLOR));
    }
    void manageRound(uint64_t) override { rounds++; }
    bool checkVictory() const override { return win; }
    bool checkDefeat() const override { return lose; }
};

int main() {
    printf("=== game engine test suite ===\n");

    // --- Button parsing ---
    {
        GameKey key;
        bool press;
        assert(parseButton("Left - Pressed", key, press));
        assert(key == GameKey::Left && press);
        assert(parseButton("Left - Released", key, press));
        assert(key == GameKey::Left && !press);
        assert(parseButton("Fire", key, press));
        assert(key == GameKey::Accelerate && press);
        assert(parseButton("A Button - Pressed", key, press));
        assert(key == GameKey::Confirm);
        assert(parseButton("B Button", key, press) && key == GameKey::HoldSwap);
        assert(parseButton("Drop", key, press) && key == GameKey::InstantDrop);
        assert(parseButton("Start", key, press) && key == GameKey::Pause);
        assert(parseButton("Select", key, press) && key == GameKey::Reset);
        assert(parseButton("Back", key, press) && key == GameKey::Menu);
        assert(!parseButton("Coin - Pressed", key, press));
        assert(key == GameKey::Unknown);
        assert(!parseButton("Left - Wiggled", key, press));
        printf("  [OK] Button parsing\n");
    }

    // --- A game needs somewhere to draw ---
    {
        Json::Value config;
        bool thrown = false;
        try {
            ProbeGame g(config, nullptr);
        } catch (const MissingSurfaceError &ex) {
            thrown = true;
            assert(std::string(ex.what()).find("surface") != std::string::npos);
        }
        assert(thrown);
        printf("  [OK] Missing surface\n");
    }

    // --- Tick updates entities, runs the rules and redraws ---
    {
        Json::Value config;
        FrameBuffer fb;
        ProbeGame g(config, &fb);
        assert(g.isRunning() && !g.isPaused());
        assert(g.outcome() == GameOutcome::None);
        assert(g.entityCount() == 2);

        g.tick(1);
        assert(g.rounds == 1);
        assert(g.group(EntityKind::Body).front()->position() == Position(1, 2));
        assert(fb.cell(1, 2) == LINE_COLOR);
        assert(fb.cell(8, 18) == SHADE_COLOR);
        assert(fb.cell(1, 1) == BACK_COLOR);
        assert(fb.litCells() == 2);
        assert(fb.flushCount() == 1);
        assert(g.group(EntityKind::Asteroid).empty());
        printf("  [OK] Tick\n");
    }

    // --- Pause freezes everything; gameplay resumes on the second press ---
    {
        Json::Value config;
        FrameBuffer fb;
        ProbeGame g(config, &fb);
        g.button("Start - Pressed");
        assert(g.isPaused());
        g.button("Start - Released");
        assert(g.isPaused());
        g.tick(1);
        g.tick(2);
        assert(g.rounds == 0);
        assert(g.group(EntityKind::Body).front()->position() == Position(1, 1));
        g.button("Start");
        assert(!g.isPaused());
        g.tick(3);
        assert(g.rounds == 1);
        printf("  [OK] Pause\n");
    }

    // --- Victory and defeat end the round and clear the board ---
    {
        Json::Value config;
        FrameBuffer fb;
        ProbeGame g(config, &fb);
        g.grant(40);
        g.win = true;
        g.lose = true;
        g.tick(1);
        assert(!g.isRunning());
        assert(g.outcome() == GameOutcome::Victory);
        assert(g.entityCount() == 0);
        assert(g.currentScore() == 40);
        assert(g.highestScore() == 40);

        // idle until reset; pause is ignored after the round
        g.tick(2);
        assert(g.rounds == 1);
        g.button("Start - Pressed");
        assert(!g.isPaused());
        g.CopyToModel();
        assert(fb.litCells() == 0);

        g.button("Select - Pressed");
        assert(g.isRunning());
        assert(g.outcome() == GameOutcome::None);
        assert(g.currentScore() == 0);
        assert(g.highestScore() == 40);

        g.lose = true;
        g.tick(3);
        assert(g.outcome() == GameOutcome::Defeat);
        printf("  [OK] Round end\n");
    }

    // --- Reset is idempotent ---
    {
        Json::Value config;
        FrameBuffer fb;
        ProbeGame g(config, &fb);
        g.tick(1);
        g.tick(2);
        g.reset();
        Position a = g.group(EntityKind::Body).front()->position();
        size_t n = g.entityCount();
        g.reset();
        assert(g.group(EntityKind::Body).front()->position() == a);
        assert(g.entityCount() == n);
        assert(g.rounds == 0);
        assert(g.currentScore() == 0);
        printf("  [OK] Reset idempotence\n");
    }

    // --- Score is capped ---
    {
        Json::Value config;
        FrameBuffer fb;
        ProbeGame g(config, &fb);
        g.grant(BrickArcadeGame::MAX_SCORE + 500);
        assert(g.currentScore() == BrickArcadeGame::MAX_SCORE);
        assert(g.highestScore() == BrickArcadeGame::MAX_SCORE);
        printf("  [OK] Score cap\n");
    }

    // --- Options ---
    {
        Json::Value config;
        config["options"]["Seed"] = "1234";
        config["options"]["Paddle Size"] = 5;
        FrameBuffer fb;
        ProbeGame g(config, &fb);
        assert(g.findOption("Seed", "") == "1234");
        assert(g.findOption("Paddle Size", "3") == "5");
        assert(g.findOption("Missing", "dflt") == "dflt");

        ProbeGame h(config, &fb);
        assert(g.context().randomInt(0, 1000000) == h.context().randomInt(0, 1000000));

        Json::Value bad;
        bad["options"]["Seed"] = "not-a-number";
        ProbeGame k(bad, &fb);
        assert(k.isRunning());
        printf("  [OK] Options\n");
    }

    printf("\n=== All tests passed ===\n");
    return 0;
}

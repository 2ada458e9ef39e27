#ifndef GAME_VIEW_H_
#define GAME_VIEW_H_

#include <string>
#include <vector>

#include "eigen_types.h"
#include "game_engine.h"

struct SeatView {
    int id;
    std::string name;
    Knowledge knowledge;
    bool role_revealed;
    Role role;
    Team team;
};

// Snapshot handed to decision providers and API callers. A player view
// carries only what that seat may know; the public view (viewer == -1)
// carries no roles until the game is over.
struct GameView {
    long game_id;
    int viewer;
    int player_count;
    int reject_limit;
    GameState state;
    bool has_mission;
    MissionConfig mission;
    std::vector<SeatView> seats;
    Role my_role;
    Team my_team;
    TrustVector beliefs;
    std::vector<HistoryEvent> history;

    std::vector<std::string> names() const;
};

GameView build_public_view(const GameEngine& engine, const long game_id);
GameView build_player_view(const GameEngine& engine, const long game_id, const int viewer);

#endif // GAME_VIEW_H_

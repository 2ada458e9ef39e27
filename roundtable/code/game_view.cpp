#include "game_view.h"

#include "errors.h"

std::vector<std::string> GameView::names() const {
    std::vector<std::string> result;
    for (const SeatView& seat : seats) {
        result.push_back(seat.name);
    }
    return result;
}

static GameView build_common(const GameEngine& engine, const long game_id) {
    GameView result;
    result.game_id = game_id;
    result.viewer = -1;
    result.player_count = engine.player_count();
    result.reject_limit = engine.rules().reject_limit;
    result.state = engine.state();
    result.has_mission = !engine.state().game_over;
    result.mission = engine.current_mission();
    result.my_role = SERVANT;
    result.my_team = GOOD;
    result.history = engine.history();
    return result;
}

GameView build_public_view(const GameEngine& engine, const long game_id) {
    GameView result = build_common(engine, game_id);
    const bool reveal = engine.state().game_over;

    for (const Player& player : engine.players()) {
        SeatView seat;
        seat.id = player.id;
        seat.name = player.name;
        seat.knowledge = UNKNOWN;
        seat.role_revealed = reveal;
        seat.role = (reveal) ? player.role : SERVANT;
        seat.team = (reveal) ? player.team : GOOD;
        result.seats.push_back(seat);
    }
    return result;
}

GameView build_player_view(const GameEngine& engine, const long game_id, const int viewer) {
    if (viewer < 0 || viewer >= engine.player_count()) {
        throw GameError(UNKNOWN_PLAYER, "no player " + std::to_string(viewer));
    }

    GameView result = build_common(engine, game_id);
    const bool reveal = engine.state().game_over;
    const Player& me = engine.players()[viewer];

    result.viewer = viewer;
    result.my_role = me.role;
    result.my_team = me.team;
    result.beliefs = engine.belief(viewer).trust_vector();

    for (const Player& player : engine.players()) {
        SeatView seat;
        seat.id = player.id;
        seat.name = player.name;
        seat.knowledge = me.visibility[player.id];
        seat.role_revealed = reveal || player.id == viewer;
        seat.role = (seat.role_revealed) ? player.role : SERVANT;
        if (seat.role_revealed || seat.knowledge == KNOWN_GOOD) {
            seat.team = player.team;
        } else if (seat.knowledge == KNOWN_EVIL) {
            seat.team = EVIL;
        } else {
            seat.team = GOOD;
        }
        result.seats.push_back(seat);
    }
    return result;
}

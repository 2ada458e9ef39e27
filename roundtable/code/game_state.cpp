#include "game_state.h"

GameState GameState::Initial() {
    GameState result;
    result.phase = TEAM_PROPOSAL;
    result.current_round = 1;
    result.vote_round = 0;
    result.reject_streak = 0;
    result.leader_index = 0;
    result.successful_missions = 0;
    result.failed_missions = 0;
    result.has_winner = false;
    result.winner = GOOD;
    result.game_over = false;
    result.assassination_target = -1;
    result.end_reason = NOT_ENDED;
    return result;
}

std::string phase_to_string(const Phase phase) {
    switch (phase) {
    case TEAM_PROPOSAL:
        return "TEAM_PROPOSAL";
    case TEAM_VOTE:
        return "TEAM_VOTE";
    case MISSION_VOTE:
        return "MISSION_VOTE";
    case MISSION_RESULT:
        return "MISSION_RESULT";
    case ASSASSINATION:
        return "ASSASSINATION";
    case GAME_OVER:
        return "GAME_OVER";
    }
    return "?????";
}

std::string end_reason_to_string(const EndReason reason) {
    switch (reason) {
    case NOT_ENDED:
        return "NOT_ENDED";
    case THREE_SUCCESSES:
        return "THREE_SUCCESSES";
    case THREE_FAILS:
        return "THREE_FAILS";
    case REJECT_LIMIT:
        return "REJECT_LIMIT";
    case MERLIN_ASSASSINATED:
        return "MERLIN_ASSASSINATED";
    case ASSASSINATION_MISSED:
        return "ASSASSINATION_MISSED";
    }
    return "?????";
}

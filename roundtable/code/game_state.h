#ifndef GAME_STATE_H_
#define GAME_STATE_H_

#include <string>
#include <vector>

#include "roles.h"

enum Phase {
    TEAM_PROPOSAL,
    TEAM_VOTE,
    MISSION_VOTE,
    MISSION_RESULT,
    ASSASSINATION,
    GAME_OVER
};

enum EndReason {
    NOT_ENDED,
    THREE_SUCCESSES,
    THREE_FAILS,
    REJECT_LIMIT,
    MERLIN_ASSASSINATED,
    ASSASSINATION_MISSED
};

struct Player {
    int id;
    std::string name;
    Role role;
    Team team;
    std::vector<Knowledge> visibility;
};

// Only the aggregate fail count is kept; who failed is never recorded.
struct MissionRecord {
    int round;
    std::vector<int> team;
    int fail_count;
    bool passed;
};

struct GameState {
    Phase phase;
    int current_round;
    int vote_round;
    int reject_streak;
    int leader_index;
    std::vector<int> current_proposal;
    std::vector<MissionRecord> mission_history;
    int successful_missions;
    int failed_missions;
    bool has_winner;
    Team winner;
    bool game_over;
    int assassination_target;
    EndReason end_reason;

    static GameState Initial();
};

std::string phase_to_string(const Phase phase);
std::string end_reason_to_string(const EndReason reason);

#endif // GAME_STATE_H_

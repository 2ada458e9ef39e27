#ifndef GAME_RULES_H_
#define GAME_RULES_H_

#include <vector>

#include "game_constants.h"
#include "roles.h"
#include "mission_rules.h"

// Per-game policy. Empty role/mission lists fall back to the catalog.
struct GameRules {
    int reject_limit;
    Team stalemate_winner;
    bool discussion;
    bool shuffle_roles;
    bool has_seed;
    unsigned int seed;
    std::vector<Role> roles;
    MissionTable missions;

    GameRules() :
        reject_limit(DEFAULT_REJECT_LIMIT),
        stalemate_winner(EVIL),
        discussion(true),
        shuffle_roles(true),
        has_seed(false),
        seed(0) {}
};

void validate_rules(const GameRules& rules, const int player_count);

std::vector<Role> role_list_for(const GameRules& rules, const int player_count);
MissionTable missions_for(const GameRules& rules, const int player_count);

#endif // GAME_RULES_H_

#include "game_rules.h"

#include <string>

#include "errors.h"
#include "game_constants.h"

void validate_rules(const GameRules& rules, const int player_count) {
    if (player_count < MIN_PLAYERS || player_count > MAX_PLAYERS) {
        throw GameError(UNSUPPORTED_PLAYER_COUNT, std::to_string(player_count) + " players");
    }
    if (rules.reject_limit < 1) {
        throw GameError(INVALID_RULES, "reject limit must be at least 1");
    }
    if (!rules.roles.empty()) {
        validate_role_set(rules.roles, player_count);
    }
    if (!rules.missions.empty()) {
        validate_mission_table(rules.missions, player_count);
    }
}

std::vector<Role> role_list_for(const GameRules& rules, const int player_count) {
    if (!rules.roles.empty()) {
        validate_role_set(rules.roles, player_count);
        return rules.roles;
    }
    return roles_for(player_count).roles;
}

MissionTable missions_for(const GameRules& rules, const int player_count) {
    if (!rules.missions.empty()) {
        validate_mission_table(rules.missions, player_count);
        return rules.missions;
    }
    return mission_table_for(player_count);
}

#include "mission_rules.h"

#include <string>

#include "errors.h"
#include "lookup_tables.h"

MissionConfig mission_config_for(const int player_count, const int round) {
    if (player_count < MIN_PLAYERS || player_count > MAX_PLAYERS) {
        throw GameError(UNSUPPORTED_PLAYER_COUNT, "no mission table for " + std::to_string(player_count) + " players");
    }
    if (round < 1 || round > NUM_ROUNDS) {
        throw GameError(INVALID_ROUND, "round " + std::to_string(round) + " is outside 1.." + std::to_string(NUM_ROUNDS));
    }

    MissionConfig result;
    result.round = round;
    result.team_size = ROUND_TO_TEAM_SIZE[player_count - MIN_PLAYERS][round - 1];
    result.fails_required = ROUND_TO_FAILS_REQUIRED[player_count - MIN_PLAYERS][round - 1];
    return result;
}

MissionTable mission_table_for(const int player_count) {
    MissionTable result;
    for (int round = 1; round <= NUM_ROUNDS; round++) {
        result.push_back(mission_config_for(player_count, round));
    }
    return result;
}

void validate_mission_table(const MissionTable& table, const int player_count) {
    if (table.size() != NUM_ROUNDS) {
        throw GameError(INVALID_RULES, "mission table needs " + std::to_string(NUM_ROUNDS) + " rounds");
    }
    for (size_t i = 0; i < table.size(); i++) {
        const MissionConfig& config = table[i];
        if (config.round != (int) i + 1) {
            throw GameError(INVALID_RULES, "mission table rounds must be 1.." + std::to_string(NUM_ROUNDS) + " in order");
        }
        if (config.team_size < 1 || config.team_size > player_count) {
            throw GameError(INVALID_RULES, "round " + std::to_string(config.round) + " team size out of range");
        }
        if (config.fails_required < 1 || config.fails_required > config.team_size) {
            throw GameError(INVALID_RULES, "round " + std::to_string(config.round) + " fail threshold out of range");
        }
    }
}

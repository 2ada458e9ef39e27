#ifndef MISSION_RULES_H_
#define MISSION_RULES_H_

#include <vector>

struct MissionConfig {
    int round;
    int team_size;
    int fails_required;
};

typedef std::vector<MissionConfig> MissionTable;

MissionConfig mission_config_for(const int player_count, const int round);
MissionTable mission_table_for(const int player_count);

// Throws INVALID_RULES for a custom table that cannot be played.
void validate_mission_table(const MissionTable& table, const int player_count);

#endif // MISSION_RULES_H_

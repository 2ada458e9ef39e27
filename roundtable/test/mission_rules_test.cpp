#include "mission_rules.h"

#include <utility>

#include "gtest/gtest.h"
#include "game_constants.h"
#include "test_util.h"

namespace {

TEST(MissionRules, FivePlayerTable) {
    const int sizes[NUM_ROUNDS] = { 2, 3, 2, 3, 3 };
    for (int round = 1; round <= NUM_ROUNDS; round++) {
        MissionConfig config = mission_config_for(5, round);
        EXPECT_EQ(round, config.round);
        EXPECT_EQ(sizes[round - 1], config.team_size);
        EXPECT_EQ(1, config.fails_required);
    }
}

TEST(MissionRules, SixPlayerTable) {
    const int sizes[NUM_ROUNDS] = { 2, 3, 4, 3, 4 };
    for (int round = 1; round <= NUM_ROUNDS; round++) {
        MissionConfig config = mission_config_for(6, round);
        EXPECT_EQ(sizes[round - 1], config.team_size);
        EXPECT_EQ(1, config.fails_required);
    }
}

TEST(MissionRules, RoundOutOfRange) {
    EXPECT_GAME_ERROR(mission_config_for(5, 0), INVALID_ROUND);
    EXPECT_GAME_ERROR(mission_config_for(5, 6), INVALID_ROUND);
    EXPECT_GAME_ERROR(mission_config_for(4, 1), UNSUPPORTED_PLAYER_COUNT);
}

TEST(MissionRules, WholeTable) {
    MissionTable table = mission_table_for(6);
    ASSERT_EQ(NUM_ROUNDS, (int) table.size());
    EXPECT_EQ(4, table[2].team_size);
    validate_mission_table(table, 6);
}

TEST(MissionRules, RejectsUnplayableCustomTables) {
    MissionTable table = mission_table_for(5);

    MissionTable too_big = table;
    too_big[0].team_size = 6;
    EXPECT_GAME_ERROR(validate_mission_table(too_big, 5), INVALID_RULES);

    MissionTable bad_threshold = table;
    bad_threshold[1].fails_required = 4;
    EXPECT_GAME_ERROR(validate_mission_table(bad_threshold, 5), INVALID_RULES);

    MissionTable short_table = table;
    short_table.pop_back();
    EXPECT_GAME_ERROR(validate_mission_table(short_table, 5), INVALID_RULES);

    MissionTable reordered = table;
    std::swap(reordered[0], reordered[1]);
    EXPECT_GAME_ERROR(validate_mission_table(reordered, 5), INVALID_RULES);

    MissionTable two_fails = table;
    two_fails[3].fails_required = 2;
    validate_mission_table(two_fails, 5);
}

}  // namespace

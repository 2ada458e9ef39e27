#ifndef TEST_UTIL_H_
#define TEST_UTIL_H_

#include <map>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "errors.h"
#include "roles.h"

#define EXPECT_GAME_ERROR(statement, expected_kind)                                      \
    try {                                                                                \
        statement;                                                                       \
        ADD_FAILURE() << "expected " << error_kind_to_string(expected_kind);             \
    } catch (const GameError& e) {                                                       \
        EXPECT_EQ(error_kind_to_string(expected_kind), error_kind_to_string(e.kind()))   \
            << e.what();                                                                 \
    }

inline std::vector<std::string> test_names(const int n) {
    std::vector<std::string> result;
    for (int i = 0; i < n; i++) {
        result.push_back("P" + std::to_string(i));
    }
    return result;
}

inline std::map<int, bool> votes_of(const std::vector<bool>& approvals) {
    std::map<int, bool> result;
    for (size_t i = 0; i < approvals.size(); i++) {
        result[(int) i] = approvals[i];
    }
    return result;
}

inline std::map<int, bool> unanimous(const int n, const bool approve) {
    return votes_of(std::vector<bool>(n, approve));
}

// 0 MERLIN, 1 PERCIVAL, 2 SERVANT, 3 ASSASSIN, 4 MORGANA
inline std::vector<Role> standard_seating_5() {
    return { MERLIN, PERCIVAL, SERVANT, ASSASSIN, MORGANA };
}

#endif // TEST_UTIL_H_

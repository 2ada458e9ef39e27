#include "lookup_tables.h"

// Rows are player counts starting at MIN_PLAYERS.
const int ROUND_TO_TEAM_SIZE[NUM_SUPPORTED_COUNTS][NUM_ROUNDS] = {
    { 2, 3, 2, 3, 3 },
    { 2, 3, 4, 3, 4 },
};

const int ROUND_TO_FAILS_REQUIRED[NUM_SUPPORTED_COUNTS][NUM_ROUNDS] = {
    { 1, 1, 1, 1, 1 },
    { 1, 1, 1, 1, 1 },
};

const int PLAYERS_TO_NUM_EVIL[NUM_SUPPORTED_COUNTS] = { 2, 2 };

const Role STANDARD_ROLES_5[5] = { MERLIN, PERCIVAL, SERVANT, ASSASSIN, MORGANA };
const Role STANDARD_ROLES_6[6] = { MERLIN, PERCIVAL, SERVANT, SERVANT, ASSASSIN, MORGANA };

// team, sees_evil, sees_merlin_and_morgana, is_assassin, concealed_from_merlin, appears_as_merlin, hidden_from_evil
const RoleCapabilities ROLE_CAPABILITIES[NUM_ROLE_TYPES] = {
    { GOOD, true,  false, false, false, true,  false }, // MERLIN
    { GOOD, false, true,  false, false, false, false }, // PERCIVAL
    { GOOD, false, false, false, false, false, false }, // SERVANT
    { EVIL, true,  false, true,  false, false, false }, // ASSASSIN
    { EVIL, true,  false, false, false, true,  false }, // MORGANA
    { EVIL, true,  false, false, true,  false, false }, // MORDRED
    { EVIL, false, false, false, false, false, true  }, // OBERON
    { EVIL, true,  false, false, false, false, false }, // MINION
};

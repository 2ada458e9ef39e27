#ifndef LOOKUP_TABLES_H_
#define LOOKUP_TABLES_H_

#include "game_constants.h"
#include "roles.h"

#define NUM_SUPPORTED_COUNTS (MAX_PLAYERS - MIN_PLAYERS + 1)

extern const int ROUND_TO_TEAM_SIZE[NUM_SUPPORTED_COUNTS][NUM_ROUNDS];
extern const int ROUND_TO_FAILS_REQUIRED[NUM_SUPPORTED_COUNTS][NUM_ROUNDS];
extern const int PLAYERS_TO_NUM_EVIL[NUM_SUPPORTED_COUNTS];

extern const Role STANDARD_ROLES_5[5];
extern const Role STANDARD_ROLES_6[6];

extern const RoleCapabilities ROLE_CAPABILITIES[NUM_ROLE_TYPES];

#endif // LOOKUP_TABLES_H_

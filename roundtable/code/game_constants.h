#ifndef GAME_CONSTANTS_H_
#define GAME_CONSTANTS_H_

#define MIN_PLAYERS 5
#define MAX_PLAYERS 6
#define NUM_ROUNDS 5
#define MISSIONS_TO_WIN 3

#define DEFAULT_REJECT_LIMIT 5

#define TRUST_FLOOR 0.05
#define TRUST_CEILING 0.95
#define TRUST_PRIOR 0.5

#define MAX_SPEECH_LENGTH 2000

#endif // GAME_CONSTANTS_H_

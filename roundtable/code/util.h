#ifndef UTIL_H_
#define UTIL_H_

#include <string>
#include <random>
#include <vector>

// Generator seeded from std::random_device through a full-state seed_seq.
std::mt19937 make_seeded_rng();
std::mt19937 make_seeded_rng(const unsigned int seed);

// "Player 1" .. "Player n".
std::vector<std::string> default_player_names(const int player_count);

// Comma separated list, surrounding whitespace trimmed, empty entries dropped.
std::vector<std::string> split_names(const std::string& text);

#endif // UTIL_H_

#include <array>
#include <algorithm>
#include <functional>
#include <sstream>

#include "util.h"

std::mt19937 make_seeded_rng() {
    std::random_device rd;
    std::array<int, std::mt19937::state_size> seed_data;
    std::generate_n(seed_data.data(), seed_data.size(), std::ref(rd));
    std::seed_seq seq(std::begin(seed_data), std::end(seed_data));
    return std::mt19937(seq);
}

std::mt19937 make_seeded_rng(const unsigned int seed) {
    std::seed_seq seq = { seed };
    return std::mt19937(seq);
}

std::vector<std::string> default_player_names(const int player_count) {
    std::vector<std::string> result;
    for (int i = 0; i < player_count; i++) {
        result.push_back("Player " + std::to_string(i + 1));
    }
    return result;
}

std::vector<std::string> split_names(const std::string& text) {
    std::vector<std::string> result;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        size_t last = item.find_last_not_of(" \t");
        result.push_back(item.substr(first, last - first + 1));
    }
    return result;
}

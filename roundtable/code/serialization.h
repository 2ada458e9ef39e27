#ifndef SERIALIZATION_H_
#define SERIALIZATION_H_

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "decisions.h"
#include "game_rules.h"
#include "game_view.h"

nlohmann::json event_to_json(const HistoryEvent& event, const std::vector<std::string>& names);
nlohmann::json view_to_json(const GameView& view);
void json_serialize_view(const GameView& view, std::ostream& out_stream);

// Strict parse of a provider reply. Anything malformed, of the wrong kind or
// out of range throws GameError(DECISION_REJECTED).
Decision parse_decision(const std::string& text, const DecisionRequest& request, const int player_count);

// Throws GameError(INVALID_RULES) on malformed input.
void json_deserialize_rules(std::istream& in_stream, GameRules* rules);

template <typename Derived>
inline std::vector<double> eigen_to_single_vector(const Eigen::ArrayBase<Derived>& array) {
    std::vector<double> result;

    for (int i = 0; i < array.rows(); i++) {
        result.push_back(array(i));
    }

    return result;
}

#endif // SERIALIZATION_H_

#include "serialization.h"

#include <iomanip>
#include <set>

#include "errors.h"
#include "game_constants.h"

using json = nlohmann::json;

static json id_or_null(const int id) {
    return (id < 0) ? json(nullptr) : json(id);
}

json event_to_json(const HistoryEvent& event, const std::vector<std::string>& names) {
    json json_event;
    json_event["seq"] = event.sequence;
    json_event["type"] = event.typeAsString();
    json_event["round"] = event.round;
    json_event["vote_round"] = event.vote_round;
    json_event["actor"] = id_or_null(event.actor);

    switch (event.type) {
    case EVENT_TEAM_PROPOSAL: {
        json_event["team"] = event.team;
    } break;
    case EVENT_VOTE: {
        json_event["approve"] = event.approve;
    } break;
    case EVENT_VOTE_RESULT: {
        json_event["team"] = event.team;
        json_event["votes"] = event.votes;
        json_event["approve_count"] = event.approve_count;
        json_event["passed"] = event.passed;
    } break;
    case EVENT_MISSION_VOTE:
        break;
    case EVENT_MISSION_RESULT: {
        json_event["team"] = event.team;
        json_event["fail_count"] = event.fail_count;
        json_event["passed"] = event.passed;
    } break;
    case EVENT_SPEECH: {
        json_event["text"] = event.text;
    } break;
    case EVENT_ASSASSINATION: {
        json_event["target"] = event.target;
        json_event["target_was_merlin"] = event.target_was_merlin;
    } break;
    case EVENT_GAME_END: {
        json_event["winner"] = team_to_string(event.winner);
        json_event["reason"] = event.text;
    } break;
    }

    json_event["display"] = describe_event(event, names);
    return json_event;
}

static json seat_to_json(const SeatView& seat) {
    json json_seat;
    json_seat["id"] = seat.id;
    json_seat["name"] = seat.name;
    json_seat["knowledge"] = knowledge_to_string(seat.knowledge);
    json_seat["role"] = (seat.role_revealed) ? json(role_to_string(seat.role)) : json(nullptr);

    bool team_known = seat.role_revealed || seat.knowledge == KNOWN_GOOD || seat.knowledge == KNOWN_EVIL;
    json_seat["team"] = (team_known) ? json(team_to_string(seat.team)) : json(nullptr);
    return json_seat;
}

json view_to_json(const GameView& view) {
    const GameState& state = view.state;
    const std::vector<std::string> names = view.names();

    json result;
    result["game_id"] = view.game_id;
    result["viewer"] = id_or_null(view.viewer);
    result["player_count"] = view.player_count;
    result["phase"] = phase_to_string(state.phase);
    result["current_round"] = state.current_round;
    result["vote_round"] = state.vote_round;
    result["reject_streak"] = state.reject_streak;
    result["reject_limit"] = view.reject_limit;
    result["leader"] = state.leader_index;
    result["current_proposal"] = state.current_proposal;
    result["successful_missions"] = state.successful_missions;
    result["failed_missions"] = state.failed_missions;
    result["game_over"] = state.game_over;
    result["winner"] = (state.has_winner) ? json(team_to_string(state.winner)) : json(nullptr);
    result["end_reason"] = end_reason_to_string(state.end_reason);
    result["assassination_target"] = id_or_null(state.assassination_target);

    if (view.has_mission) {
        result["mission"] = {
            { "round", view.mission.round },
            { "team_size", view.mission.team_size },
            { "fails_required", view.mission.fails_required },
        };
    } else {
        result["mission"] = nullptr;
    }

    result["mission_history"] = json::array();
    for (const MissionRecord& record : state.mission_history) {
        result["mission_history"].push_back({
            { "round", record.round },
            { "team", record.team },
            { "fail_count", record.fail_count },
            { "passed", record.passed },
        });
    }

    result["players"] = json::array();
    for (const SeatView& seat : view.seats) {
        result["players"].push_back(seat_to_json(seat));
    }

    if (view.viewer >= 0) {
        result["me"] = {
            { "role", role_to_string(view.my_role) },
            { "team", team_to_string(view.my_team) },
        };
        result["beliefs"] = eigen_to_single_vector(view.beliefs);
    }

    result["history"] = json::array();
    for (const HistoryEvent& event : view.history) {
        result["history"].push_back(event_to_json(event, names));
    }

    return result;
}

void json_serialize_view(const GameView& view, std::ostream& out_stream) {
    out_stream << std::setprecision(6) << std::setw(2) << view_to_json(view) << std::endl;
}

static void reject(const std::string& message) {
    throw GameError(DECISION_REJECTED, message);
}

static int parse_player_id(const json& value, const int player_count, const std::string& field) {
    if (!value.is_number_integer()) {
        reject("'" + field + "' must hold integer player ids");
    }
    long long id = value.get<long long>();
    if (id < 0 || id >= player_count) {
        reject("'" + field + "' holds unknown player " + std::to_string(id));
    }
    return (int) id;
}

static const json& require_field(const json& object, const std::string& field) {
    auto it = object.find(field);
    if (it == object.end()) {
        reject("missing '" + field + "'");
    }
    return *it;
}

Decision parse_decision(const std::string& text, const DecisionRequest& request, const int player_count) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw GameError(DECISION_REJECTED, std::string("malformed reply: ") + e.what());
    }

    if (!j.is_object()) {
        reject("reply must be a JSON object");
    }

    const json& type_field = require_field(j, "type");
    if (!type_field.is_string()) {
        reject("'type' must be a string");
    }
    DecisionType type;
    if (!decision_type_from_string(type_field.get<std::string>(), &type)) {
        reject("unknown decision type '" + type_field.get<std::string>() + "'");
    }
    if (type != request.type) {
        reject("expected a " + decision_type_to_string(request.type) + " decision, got " + decision_type_to_string(type));
    }

    std::string payload_field;
    Decision result;
    switch (type) {
    case DECIDE_TEAM_PROPOSAL: {
        payload_field = "members";
        const json& members = require_field(j, payload_field);
        if (!members.is_array()) {
            reject("'members' must be an array");
        }
        std::vector<int> ids;
        std::set<int> seen;
        for (const json& member : members) {
            int id = parse_player_id(member, player_count, payload_field);
            if (!seen.insert(id).second) {
                reject("'members' lists player " + std::to_string(id) + " twice");
            }
            ids.push_back(id);
        }
        result = Decision::TeamProposal(ids);
    } break;
    case DECIDE_VOTE: {
        payload_field = "approve";
        const json& approve = require_field(j, payload_field);
        if (!approve.is_boolean()) {
            reject("'approve' must be a boolean");
        }
        result = Decision::Vote(approve.get<bool>());
    } break;
    case DECIDE_MISSION_VOTE: {
        payload_field = "success";
        const json& success = require_field(j, payload_field);
        if (!success.is_boolean()) {
            reject("'success' must be a boolean");
        }
        result = Decision::MissionVote(success.get<bool>());
    } break;
    case DECIDE_ASSASSINATION: {
        payload_field = "target";
        result = Decision::Assassination(parse_player_id(require_field(j, payload_field), player_count, payload_field));
    } break;
    case DECIDE_SPEECH: {
        payload_field = "text";
        const json& speech = require_field(j, payload_field);
        if (!speech.is_string()) {
            reject("'text' must be a string");
        }
        std::string value = speech.get<std::string>();
        if (value.empty() || value.size() > MAX_SPEECH_LENGTH) {
            reject("'text' must be 1.." + std::to_string(MAX_SPEECH_LENGTH) + " bytes");
        }
        result = Decision::Speech(value);
    } break;
    }

    // A free-form "reason" is tolerated; anything else is not.
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "type" && it.key() != "reason" && it.key() != payload_field) {
            reject("unexpected field '" + it.key() + "'");
        }
    }

    return result;
}

void json_deserialize_rules(std::istream& in_stream, GameRules* rules) {
    json j;
    try {
        in_stream >> j;
    } catch (const json::parse_error& e) {
        throw GameError(INVALID_RULES, std::string("malformed rules file: ") + e.what());
    }

    if (!j.is_object()) {
        throw GameError(INVALID_RULES, "rules must be a JSON object");
    }

    // Parsed in full before anything reaches the caller's rules.
    GameRules parsed = *rules;
    try {
        if (j.count("reject_limit")) parsed.reject_limit = j.at("reject_limit").get<int>();
        if (j.count("discussion")) parsed.discussion = j.at("discussion").get<bool>();
        if (j.count("shuffle_roles")) parsed.shuffle_roles = j.at("shuffle_roles").get<bool>();
        if (j.count("seed")) {
            parsed.seed = j.at("seed").get<unsigned int>();
            parsed.has_seed = true;
        }
        if (j.count("stalemate_winner")) {
            std::string winner = j.at("stalemate_winner").get<std::string>();
            if (winner != "GOOD" && winner != "EVIL") {
                throw GameError(INVALID_RULES, "stalemate_winner must be GOOD or EVIL");
            }
            parsed.stalemate_winner = (winner == "GOOD") ? GOOD : EVIL;
        }
        if (j.count("roles")) {
            parsed.roles.clear();
            for (const json& name : j.at("roles")) {
                Role role;
                if (!role_from_string(name.get<std::string>(), &role)) {
                    throw GameError(INVALID_RULES, "unknown role '" + name.get<std::string>() + "'");
                }
                parsed.roles.push_back(role);
            }
        }
        if (j.count("missions")) {
            parsed.missions.clear();
            int round = 1;
            for (const json& mission : j.at("missions")) {
                MissionConfig config;
                config.round = round++;
                config.team_size = mission.at("team_size").get<int>();
                config.fails_required = (mission.count("fails_required")) ? mission.at("fails_required").get<int>() : 1;
                parsed.missions.push_back(config);
            }
        }
    } catch (const json::exception& e) {
        throw GameError(INVALID_RULES, e.what());
    }

    *rules = parsed;
}

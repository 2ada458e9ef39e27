#include "history.h"

#include <sstream>

HistoryEvent::HistoryEvent() :
    sequence(-1),
    type(EVENT_SPEECH),
    round(0),
    vote_round(0),
    actor(-1),
    approve(false),
    approve_count(0),
    fail_count(0),
    passed(false),
    target(-1),
    target_was_merlin(false),
    winner(GOOD) {}

HistoryEvent HistoryEvent::Of(EventType type, int round, int vote_round, int actor) {
    HistoryEvent result;
    result.type = type;
    result.round = round;
    result.vote_round = vote_round;
    result.actor = actor;
    return result;
}

std::string HistoryEvent::typeAsString() const {
    switch (type) {
    case EVENT_TEAM_PROPOSAL:
        return "TeamProposal";
    case EVENT_VOTE:
        return "Vote";
    case EVENT_VOTE_RESULT:
        return "VoteResult";
    case EVENT_MISSION_VOTE:
        return "MissionVote";
    case EVENT_MISSION_RESULT:
        return "MissionResult";
    case EVENT_SPEECH:
        return "Speech";
    case EVENT_ASSASSINATION:
        return "Assassination";
    case EVENT_GAME_END:
        return "GameEnd";
    }
    return "?????";
}

static std::string name_of(const std::vector<std::string>& names, const int id) {
    if (id >= 0 && id < (int) names.size()) {
        return names[id];
    }
    return "#" + std::to_string(id);
}

static std::string join_team(const std::vector<std::string>& names, const std::vector<int>& team) {
    std::stringstream stream;
    for (size_t i = 0; i < team.size(); i++) {
        stream << ((i == 0) ? "" : ", ") << name_of(names, team[i]);
    }
    return stream.str();
}

std::string describe_event(const HistoryEvent& event, const std::vector<std::string>& names) {
    std::stringstream stream;
    stream << "[" << event.sequence << "] R" << event.round << " ";

    switch (event.type) {
    case EVENT_TEAM_PROPOSAL: {
        stream << name_of(names, event.actor) << " proposes " << join_team(names, event.team);
    } break;
    case EVENT_VOTE: {
        stream << name_of(names, event.actor) << ((event.approve) ? " approves" : " rejects");
    } break;
    case EVENT_VOTE_RESULT: {
        stream << "vote " << ((event.passed) ? "passes " : "fails ") << event.approve_count << "/" << event.votes.size();
    } break;
    case EVENT_MISSION_VOTE: {
        stream << name_of(names, event.actor) << " plays a mission card";
    } break;
    case EVENT_MISSION_RESULT: {
        stream << "mission " << ((event.passed) ? "succeeds" : "fails") << " with " << event.fail_count << " fail(s)";
    } break;
    case EVENT_SPEECH: {
        stream << name_of(names, event.actor) << ": " << event.text;
    } break;
    case EVENT_ASSASSINATION: {
        stream << name_of(names, event.actor) << " assassinates " << name_of(names, event.target)
               << ((event.target_was_merlin) ? " (Merlin)" : " (not Merlin)");
    } break;
    case EVENT_GAME_END: {
        stream << team_to_string(event.winner) << " wins: " << event.text;
    } break;
    }
    return stream.str();
}

#include "decisions.h"

Decision Decision::TeamProposal(const std::vector<int>& members) {
    Decision result;
    result.type = DECIDE_TEAM_PROPOSAL;
    result.members = members;
    return result;
}

Decision Decision::Vote(bool approve) {
    Decision result;
    result.type = DECIDE_VOTE;
    result.approve = approve;
    return result;
}

Decision Decision::MissionVote(bool success) {
    Decision result;
    result.type = DECIDE_MISSION_VOTE;
    result.success = success;
    return result;
}

Decision Decision::Assassination(int target) {
    Decision result;
    result.type = DECIDE_ASSASSINATION;
    result.target = target;
    return result;
}

Decision Decision::Speech(const std::string& text) {
    Decision result;
    result.type = DECIDE_SPEECH;
    result.text = text;
    return result;
}

std::string decision_type_to_string(const DecisionType type) {
    switch (type) {
    case DECIDE_TEAM_PROPOSAL:
        return "team_proposal";
    case DECIDE_VOTE:
        return "vote";
    case DECIDE_MISSION_VOTE:
        return "mission_vote";
    case DECIDE_ASSASSINATION:
        return "assassination";
    case DECIDE_SPEECH:
        return "speech";
    }
    return "?????";
}

bool decision_type_from_string(const std::string& name, DecisionType* type) {
    for (int i = DECIDE_TEAM_PROPOSAL; i <= DECIDE_SPEECH; i++) {
        if (decision_type_to_string((DecisionType) i) == name) {
            *type = (DecisionType) i;
            return true;
        }
    }
    return false;
}

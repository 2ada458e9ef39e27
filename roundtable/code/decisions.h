#ifndef DECISIONS_H_
#define DECISIONS_H_

#include <string>
#include <vector>

enum DecisionType {
    DECIDE_TEAM_PROPOSAL,
    DECIDE_VOTE,
    DECIDE_MISSION_VOTE,
    DECIDE_ASSASSINATION,
    DECIDE_SPEECH
};

struct DecisionRequest {
    DecisionType type;
    int player;
};

// Tagged decision. Only the field matching `type` is meaningful.
struct Decision {
    DecisionType type;
    std::vector<int> members;
    bool approve;
    bool success;
    int target;
    std::string text;

    Decision() : type(DECIDE_SPEECH), approve(false), success(true), target(-1) {}

    static Decision TeamProposal(const std::vector<int>& members);
    static Decision Vote(bool approve);
    static Decision MissionVote(bool success);
    static Decision Assassination(int target);
    static Decision Speech(const std::string& text);
};

std::string decision_type_to_string(const DecisionType type);
bool decision_type_from_string(const std::string& name, DecisionType* type);

#endif // DECISIONS_H_

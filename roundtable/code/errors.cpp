#include "errors.h"

std::string error_kind_to_string(const ErrorKind kind) {
    switch (kind) {
    case UNSUPPORTED_PLAYER_COUNT:
        return "UnsupportedPlayerCount";
    case INVALID_ROUND:
        return "InvalidRound";
    case ILLEGAL_PROPOSAL:
        return "IllegalProposal";
    case ILLEGAL_VOTE:
        return "IllegalVote";
    case ILLEGAL_MISSION_VOTE:
        return "IllegalMissionVote";
    case ILLEGAL_ASSASSINATION:
        return "IllegalAssassination";
    case ILLEGAL_SPEECH:
        return "IllegalSpeech";
    case DECISION_REJECTED:
        return "DecisionRejected";
    case PROVIDER_UNAVAILABLE:
        return "ProviderUnavailable";
    case UNKNOWN_GAME:
        return "UnknownGame";
    case UNKNOWN_PLAYER:
        return "UnknownPlayer";
    case INVALID_RULES:
        return "InvalidRules";
    }
    return "?????";
}

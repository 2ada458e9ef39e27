#ifndef ERRORS_H_
#define ERRORS_H_

#include <stdexcept>
#include <string>

enum ErrorKind {
    UNSUPPORTED_PLAYER_COUNT,
    INVALID_ROUND,
    ILLEGAL_PROPOSAL,
    ILLEGAL_VOTE,
    ILLEGAL_MISSION_VOTE,
    ILLEGAL_ASSASSINATION,
    ILLEGAL_SPEECH,
    DECISION_REJECTED,
    PROVIDER_UNAVAILABLE,
    UNKNOWN_GAME,
    UNKNOWN_PLAYER,
    INVALID_RULES
};

std::string error_kind_to_string(const ErrorKind kind);

class GameError : public std::runtime_error {
public:
    GameError(ErrorKind kind, const std::string& message) :
        std::runtime_error(error_kind_to_string(kind) + ": " + message),
        kind_(kind),
        reason_(message) {}

    ErrorKind kind() const { return kind_; }

    // The message without the kind prefix.
    const std::string& reason() const { return reason_; }

private:
    ErrorKind kind_;
    std::string reason_;
};

#endif // ERRORS_H_

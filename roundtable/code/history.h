#ifndef HISTORY_H_
#define HISTORY_H_

#include <string>
#include <vector>

#include "roles.h"

enum EventType {
    EVENT_TEAM_PROPOSAL,
    EVENT_VOTE,
    EVENT_VOTE_RESULT,
    EVENT_MISSION_VOTE,
    EVENT_MISSION_RESULT,
    EVENT_SPEECH,
    EVENT_ASSASSINATION,
    EVENT_GAME_END
};

// Fields are meaningful only for the event types that set them.
// EVENT_MISSION_VOTE records that the actor voted, never how.
struct HistoryEvent {
    long sequence;
    EventType type;
    int round;
    int vote_round;
    int actor;

    std::vector<int> team;
    std::vector<bool> votes;
    bool approve;
    int approve_count;
    int fail_count;
    bool passed;
    int target;
    bool target_was_merlin;
    Team winner;
    std::string text;

    HistoryEvent();

    std::string typeAsString() const;

    static HistoryEvent Of(EventType type, int round, int vote_round, int actor);
};

std::string describe_event(const HistoryEvent& event, const std::vector<std::string>& names);

#endif // HISTORY_H_

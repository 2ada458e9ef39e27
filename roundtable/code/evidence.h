#ifndef EVIDENCE_H_
#define EVIDENCE_H_

#include <vector>

#include "belief_model.h"
#include "history.h"

// The observer's own mission card, the only one it is allowed to know.
enum OwnMissionVote {
    NOT_ON_MISSION,
    VOTED_SUCCESS,
    VOTED_FAIL
};

#define TRUSTED_THRESHOLD 0.7
#define DISTRUSTED_THRESHOLD 0.3
#define MAX_REJECTION_STREAK 4

std::vector<Evidence> project_evidence(
    const HistoryEvent& event,
    const BeliefModel& observer,
    const OwnMissionVote own_vote
);

#endif // EVIDENCE_H_

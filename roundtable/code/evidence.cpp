#include "evidence.h"

#include <algorithm>

#include "game_constants.h"

static bool updatable(const BeliefModel& observer, const int subject) {
    return subject >= 0 && subject < observer.size() && subject != observer.owner() && !observer.pinned(subject);
}

static bool contains(const std::vector<int>& team, const int player) {
    return std::find(team.begin(), team.end(), player) != team.end();
}

// Any member other than `skip` the observer trusts at or above the threshold.
static bool has_trusted_member(const BeliefModel& observer, const std::vector<int>& team, const int skip) {
    for (int member : team) {
        if (member != skip && observer.trust(member) >= TRUSTED_THRESHOLD) return true;
    }
    return false;
}

static bool has_distrusted_member(const BeliefModel& observer, const std::vector<int>& team, const int skip) {
    for (int member : team) {
        if (member != skip && observer.trust(member) <= DISTRUSTED_THRESHOLD) return true;
    }
    return false;
}

static Evidence make_evidence(int subject, double l_good, double l_evil, EvidenceReason reason) {
    Evidence result;
    result.subject = subject;
    result.l_good = l_good;
    result.l_evil = l_evil;
    result.reason = reason;
    return result;
}

static void project_proposal(const HistoryEvent& event, const BeliefModel& observer, std::vector<Evidence>* out) {
    int leader = event.actor;
    if (!updatable(observer, leader)) return;
    if (has_distrusted_member(observer, event.team, leader)) {
        out->push_back(make_evidence(leader, 1.0, 1.1, PROPOSED_DISTRUSTED_TEAM));
    }
}

static void project_vote_result(const HistoryEvent& event, const BeliefModel& observer, std::vector<Evidence>* out) {
    for (int voter = 0; voter < (int) event.votes.size(); voter++) {
        if (!updatable(observer, voter)) continue;

        if (event.votes[voter]) {
            if (has_distrusted_member(observer, event.team, voter)) {
                out->push_back(make_evidence(voter, 1.0, 1.1, APPROVED_DISTRUSTED_TEAM));
            }
            continue;
        }

        if (has_trusted_member(observer, event.team, voter)) {
            int streak = std::min(MAX_REJECTION_STREAK, observer.suspicious_rejections(voter) + 1);
            out->push_back(make_evidence(voter, 1.0, 1.0 + 0.15 * streak, REJECTED_TRUSTED_TEAM));
        }
        if (contains(event.team, voter)) {
            out->push_back(make_evidence(voter, 1.0, 1.2, REJECTED_OWN_TEAM));
        }
    }
}

static void project_mission_result(const HistoryEvent& event, const BeliefModel& observer, const OwnMissionVote own_vote, std::vector<Evidence>* out) {
    // Take the observer's own card out of the aggregate before blaming anyone else.
    int team_size = (int) event.team.size();
    int fails = event.fail_count;
    if (own_vote != NOT_ON_MISSION) {
        team_size--;
        if (own_vote == VOTED_FAIL) fails--;
    }

    // Seats the observer knows to be evil may have played the remaining fails.
    int known_evil = 0;
    for (int member : event.team) {
        if (observer.known_evil(member)) known_evil++;
    }
    team_size -= known_evil;
    fails -= std::min(std::max(fails, 0), known_evil);

    for (int member : event.team) {
        if (!updatable(observer, member)) continue;

        if (fails <= 0) {
            out->push_back(make_evidence(member, 1.0, 0.9, MISSION_SUCCEEDED));
        } else if (fails >= team_size) {
            out->push_back(make_evidence(member, TRUST_FLOOR, 1.0, MISSION_FAILED_ALL));
        } else {
            double share = (double) fails / team_size;
            out->push_back(make_evidence(member, std::max(TRUST_FLOOR, 1.0 - share), 1.0, MISSION_FAILED_PARTIAL));
        }
    }
}

std::vector<Evidence> project_evidence(
    const HistoryEvent& event,
    const BeliefModel& observer,
    const OwnMissionVote own_vote
) {
    std::vector<Evidence> result;

    switch (event.type) {
    case EVENT_TEAM_PROPOSAL: {
        project_proposal(event, observer, &result);
    } break;
    case EVENT_VOTE_RESULT: {
        project_vote_result(event, observer, &result);
    } break;
    case EVENT_MISSION_RESULT: {
        project_mission_result(event, observer, own_vote, &result);
    } break;
    case EVENT_VOTE:
    case EVENT_MISSION_VOTE:
    case EVENT_SPEECH:
    case EVENT_ASSASSINATION:
    case EVENT_GAME_END:
    default: break;
    }

    return result;
}

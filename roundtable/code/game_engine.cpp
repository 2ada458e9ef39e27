#include "game_engine.h"

#include <algorithm>
#include <set>

#include "errors.h"

GameEngine::GameEngine(const std::vector<std::string>& names, const std::vector<Role>& seating, const GameRules& rules) :
    rules_(rules),
    state_(GameState::Initial()),
    next_sequence_(0) {
    const int n = (int) seating.size();
    validate_rules(rules, n);
    validate_role_set(seating, n);
    if ((int) names.size() != n) {
        throw GameError(INVALID_RULES, "expected " + std::to_string(n) + " names, got " + std::to_string(names.size()));
    }

    missions_ = missions_for(rules, n);

    VisibilityMatrix visibility = derive_visibility(seating);
    int num_evil = 0;
    for (Role role : seating) {
        if (team_of(role) == EVIL) num_evil++;
    }

    for (int i = 0; i < n; i++) {
        Player player;
        player.id = i;
        player.name = names[i];
        player.role = seating[i];
        player.team = team_of(seating[i]);
        player.visibility = visibility[i];
        players_.push_back(player);
        beliefs_.emplace_back(i, player.team, visibility[i], num_evil);
    }
}

std::unique_ptr<GameEngine> GameEngine::NewGame(const std::vector<std::string>& names, const GameRules& rules, std::mt19937* rng) {
    const int n = (int) names.size();
    validate_rules(rules, n);

    std::vector<Role> seating = role_list_for(rules, n);
    if (rules.shuffle_roles) {
        std::shuffle(seating.begin(), seating.end(), *rng);
    }
    return std::make_unique<GameEngine>(names, seating, rules);
}

std::vector<std::string> GameEngine::names() const {
    std::vector<std::string> result;
    for (const Player& player : players_) {
        result.push_back(player.name);
    }
    return result;
}

MissionConfig GameEngine::current_mission() const {
    return missions_.at(state_.current_round - 1);
}

int GameEngine::assassin() const {
    for (const Player& player : players_) {
        if (capabilities(player.role).is_assassin) return player.id;
    }
    return -1;
}

void GameEngine::check_proposal(const int leader, const std::vector<int>& members) const {
    if (state_.phase != TEAM_PROPOSAL) {
        throw GameError(ILLEGAL_PROPOSAL, "cannot propose during " + phase_to_string(state_.phase));
    }
    if (leader != state_.leader_index) {
        throw GameError(ILLEGAL_PROPOSAL, "player " + std::to_string(leader) + " is not the leader");
    }

    const int team_size = current_mission().team_size;
    if ((int) members.size() != team_size) {
        throw GameError(ILLEGAL_PROPOSAL, "team needs " + std::to_string(team_size) + " members, got " + std::to_string(members.size()));
    }

    std::set<int> seen;
    for (int member : members) {
        if (member < 0 || member >= player_count()) {
            throw GameError(ILLEGAL_PROPOSAL, "no player " + std::to_string(member));
        }
        if (!seen.insert(member).second) {
            throw GameError(ILLEGAL_PROPOSAL, "player " + std::to_string(member) + " listed twice");
        }
    }
}

void GameEngine::check_votes(const std::map<int, bool>& votes) const {
    if (state_.phase != TEAM_VOTE) {
        throw GameError(ILLEGAL_VOTE, "cannot vote during " + phase_to_string(state_.phase));
    }
    for (const auto& pair : votes) {
        if (pair.first < 0 || pair.first >= player_count()) {
            throw GameError(ILLEGAL_VOTE, "no player " + std::to_string(pair.first));
        }
    }
    if ((int) votes.size() != player_count()) {
        throw GameError(ILLEGAL_VOTE, "every player votes exactly once, got " + std::to_string(votes.size()) + " votes");
    }
}

void GameEngine::check_mission_votes(const std::map<int, bool>& success_by_member) const {
    if (state_.phase != MISSION_VOTE) {
        throw GameError(ILLEGAL_MISSION_VOTE, "cannot play mission cards during " + phase_to_string(state_.phase));
    }

    const std::vector<int>& team = state_.current_proposal;
    for (const auto& pair : success_by_member) {
        if (std::find(team.begin(), team.end(), pair.first) == team.end()) {
            throw GameError(ILLEGAL_MISSION_VOTE, "player " + std::to_string(pair.first) + " is not on the mission");
        }
        if (!pair.second && players_[pair.first].team == GOOD) {
            throw GameError(ILLEGAL_MISSION_VOTE, "good player " + std::to_string(pair.first) + " cannot fail a mission");
        }
    }
    if (success_by_member.size() != team.size()) {
        throw GameError(ILLEGAL_MISSION_VOTE, "every team member plays exactly one card");
    }
}

void GameEngine::check_assassination(const int assassin, const int target) const {
    if (state_.phase != ASSASSINATION) {
        throw GameError(ILLEGAL_ASSASSINATION, "cannot assassinate during " + phase_to_string(state_.phase));
    }
    if (assassin != this->assassin()) {
        throw GameError(ILLEGAL_ASSASSINATION, "player " + std::to_string(assassin) + " is not the assassin");
    }
    if (target < 0 || target >= player_count() || target == assassin) {
        throw GameError(ILLEGAL_ASSASSINATION, "invalid target " + std::to_string(target));
    }
}

void GameEngine::check_speech(const int speaker, const std::string& text) const {
    if (state_.game_over) {
        throw GameError(ILLEGAL_SPEECH, "the game is over");
    }
    if (speaker < 0 || speaker >= player_count()) {
        throw GameError(ILLEGAL_SPEECH, "no player " + std::to_string(speaker));
    }
    if (text.empty() || text.size() > MAX_SPEECH_LENGTH) {
        throw GameError(ILLEGAL_SPEECH, "speech must be 1.." + std::to_string(MAX_SPEECH_LENGTH) + " bytes");
    }
}

void GameEngine::propose_team(const int leader, const std::vector<int>& members) {
    check_proposal(leader, members);

    state_.current_proposal = members;
    state_.phase = TEAM_VOTE;

    HistoryEvent event = HistoryEvent::Of(EVENT_TEAM_PROPOSAL, state_.current_round, state_.vote_round, leader);
    event.team = members;
    emit(event, nullptr);
}

void GameEngine::cast_votes(const std::map<int, bool>& votes) {
    check_votes(votes);

    std::vector<bool> by_player(player_count(), false);
    int approve_count = 0;
    for (const auto& pair : votes) {
        by_player[pair.first] = pair.second;
        if (pair.second) approve_count++;
    }
    // Strict majority; a tie rejects.
    const bool passed = approve_count > player_count() / 2;

    for (int voter = 0; voter < player_count(); voter++) {
        HistoryEvent vote = HistoryEvent::Of(EVENT_VOTE, state_.current_round, state_.vote_round, voter);
        vote.approve = by_player[voter];
        emit(vote, nullptr);
    }

    HistoryEvent result = HistoryEvent::Of(EVENT_VOTE_RESULT, state_.current_round, state_.vote_round, state_.leader_index);
    result.team = state_.current_proposal;
    result.votes = by_player;
    result.approve_count = approve_count;
    result.passed = passed;
    emit(result, nullptr);

    if (passed) {
        state_.reject_streak = 0;
        state_.vote_round = 0;
        state_.phase = MISSION_VOTE;
        return;
    }

    state_.reject_streak++;
    state_.vote_round++;
    state_.current_proposal.clear();
    if (state_.reject_streak >= rules_.reject_limit) {
        finish(rules_.stalemate_winner, REJECT_LIMIT);
        return;
    }
    advance_leader();
    state_.phase = TEAM_PROPOSAL;
}

void GameEngine::cast_mission_votes(const std::map<int, bool>& success_by_member) {
    check_mission_votes(success_by_member);

    int fail_count = 0;
    for (const auto& pair : success_by_member) {
        if (!pair.second) fail_count++;
    }

    MissionRecord record;
    record.round = state_.current_round;
    record.team = state_.current_proposal;
    record.fail_count = fail_count;
    record.passed = fail_count < current_mission().fails_required;

    state_.phase = MISSION_RESULT;
    state_.mission_history.push_back(record);
    if (record.passed) {
        state_.successful_missions++;
    } else {
        state_.failed_missions++;
    }

    for (int member : record.team) {
        emit(HistoryEvent::Of(EVENT_MISSION_VOTE, record.round, state_.vote_round, member), nullptr);
    }

    HistoryEvent result = HistoryEvent::Of(EVENT_MISSION_RESULT, record.round, state_.vote_round, -1);
    result.team = record.team;
    result.fail_count = fail_count;
    result.passed = record.passed;
    emit(result, &success_by_member);

    if (state_.failed_missions >= MISSIONS_TO_WIN) {
        finish(EVIL, THREE_FAILS);
    } else if (state_.successful_missions >= MISSIONS_TO_WIN) {
        if (assassin() >= 0) {
            state_.current_proposal.clear();
            state_.phase = ASSASSINATION;
        } else {
            finish(GOOD, THREE_SUCCESSES);
        }
    } else {
        advance_round();
    }
}

void GameEngine::assassinate(const int assassin, const int target) {
    check_assassination(assassin, target);

    const bool hit = players_[target].role == MERLIN;
    state_.assassination_target = target;

    HistoryEvent event = HistoryEvent::Of(EVENT_ASSASSINATION, state_.current_round, state_.vote_round, assassin);
    event.target = target;
    event.target_was_merlin = hit;
    emit(event, nullptr);

    if (hit) {
        finish(EVIL, MERLIN_ASSASSINATED);
    } else {
        finish(GOOD, ASSASSINATION_MISSED);
    }
}

void GameEngine::record_speech(const int speaker, const std::string& text) {
    check_speech(speaker, text);

    HistoryEvent event = HistoryEvent::Of(EVENT_SPEECH, state_.current_round, state_.vote_round, speaker);
    event.text = text;
    emit(event, nullptr);
}

void GameEngine::emit(HistoryEvent event, const std::map<int, bool>* mission_votes) {
    event.sequence = next_sequence_++;
    history_.push_back(event);

    for (BeliefModel& belief : beliefs_) {
        OwnMissionVote own_vote = NOT_ON_MISSION;
        if (mission_votes != nullptr) {
            auto it = mission_votes->find(belief.owner());
            if (it != mission_votes->end()) {
                own_vote = (it->second) ? VOTED_SUCCESS : VOTED_FAIL;
            }
        }
        belief.apply(event.sequence, project_evidence(history_.back(), belief, own_vote));
    }
}

void GameEngine::finish(const Team winner, const EndReason reason) {
    state_.game_over = true;
    state_.has_winner = true;
    state_.winner = winner;
    state_.end_reason = reason;
    state_.phase = GAME_OVER;
    state_.current_proposal.clear();

    HistoryEvent event = HistoryEvent::Of(EVENT_GAME_END, state_.current_round, state_.vote_round, -1);
    event.winner = winner;
    event.text = end_reason_to_string(reason);
    emit(event, nullptr);
}

void GameEngine::advance_round() {
    state_.current_round++;
    state_.vote_round = 0;
    state_.current_proposal.clear();
    advance_leader();
    state_.phase = TEAM_PROPOSAL;
}

void GameEngine::advance_leader() {
    state_.leader_index = (state_.leader_index + 1) % player_count();
}
